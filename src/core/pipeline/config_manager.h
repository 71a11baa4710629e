#pragma once

#include "core/pipeline/pipeline_config.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace il {

// ConfigManager -- JSON save/load for the pipeline configuration.
//
// The default file lives at:
//   <GenericConfigLocation>/incidentlens/pipeline.json
// Keys are flat (thresholdFloor, topResolvers, payloadSchema, ...); absent
// keys keep their defaults. Loading does not validate ranges; that happens
// when the pipeline is created.
class ConfigManager {
public:
    // Returns nullopt if the file cannot be read, is not a JSON object, or
    // holds a value of the wrong type.
    static std::optional<PipelineConfig> load(const QString& filePath,
                                              QString* errorOut = nullptr);

    // Defaults when the default file does not exist; nullopt when it
    // exists but cannot be loaded.
    static std::optional<PipelineConfig> loadDefault(QString* errorOut = nullptr);

    // Creates the parent directory if needed. Returns true on success.
    static bool save(const PipelineConfig& config, const QString& filePath);

    static QString defaultConfigFilePath();

    static QJsonObject toJson(const PipelineConfig& config);
    static std::optional<PipelineConfig> fromJson(const QJsonObject& json,
                                                  QString* errorOut = nullptr);
};

} // namespace il
