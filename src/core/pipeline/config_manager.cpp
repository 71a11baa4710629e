#include "core/pipeline/config_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QStandardPaths>

#include <cmath>
#include <limits>

namespace il {

namespace {

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

bool readDouble(const QJsonObject& json, const QString& key, double* target, QString* errorOut)
{
    if (!json.contains(key)) {
        return true;
    }
    const QJsonValue value = json.value(key);
    if (!value.isDouble()) {
        setError(errorOut, QStringLiteral("%1 must be a number").arg(key));
        return false;
    }
    *target = value.toDouble();
    return true;
}

bool readInt(const QJsonObject& json, const QString& key, int* target, QString* errorOut)
{
    if (!json.contains(key)) {
        return true;
    }
    const QJsonValue value = json.value(key);
    double integral = 0.0;
    if (!value.isDouble() || std::modf(value.toDouble(), &integral) != 0.0) {
        setError(errorOut, QStringLiteral("%1 must be an integer").arg(key));
        return false;
    }
    // toInt() yields 0 for values outside int range
    if (integral < static_cast<double>(std::numeric_limits<int>::min())
        || integral > static_cast<double>(std::numeric_limits<int>::max())) {
        setError(errorOut, QStringLiteral("%1 is out of range").arg(key));
        return false;
    }
    *target = static_cast<int>(integral);
    return true;
}

bool readString(const QJsonObject& json, const QString& key, QString* target, QString* errorOut)
{
    if (!json.contains(key)) {
        return true;
    }
    const QJsonValue value = json.value(key);
    if (!value.isString()) {
        setError(errorOut, QStringLiteral("%1 must be a string").arg(key));
        return false;
    }
    *target = value.toString();
    return true;
}

} // namespace

std::optional<PipelineConfig> ConfigManager::load(const QString& filePath, QString* errorOut)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        const QString message = QStringLiteral("cannot open config file %1: %2")
                                    .arg(filePath, file.errorString());
        LOG_WARN(ilCore, "%s", qUtf8Printable(message));
        setError(errorOut, message);
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        const QString message = QStringLiteral("failed to parse config JSON (%1): %2")
                                    .arg(filePath, parseError.errorString());
        LOG_WARN(ilCore, "%s", qUtf8Printable(message));
        setError(errorOut, message);
        return std::nullopt;
    }

    QString fieldError;
    std::optional<PipelineConfig> config = fromJson(doc.object(), &fieldError);
    if (!config) {
        const QString message = QStringLiteral("invalid config file %1: %2")
                                    .arg(filePath, fieldError);
        LOG_WARN(ilCore, "%s", qUtf8Printable(message));
        setError(errorOut, message);
    }
    return config;
}

std::optional<PipelineConfig> ConfigManager::loadDefault(QString* errorOut)
{
    const QString filePath = defaultConfigFilePath();
    if (!QFileInfo::exists(filePath)) {
        return PipelineConfig{};
    }
    return load(filePath, errorOut);
}

bool ConfigManager::save(const PipelineConfig& config, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(ilCore, "Failed to create config directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(config));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(ilCore, "Failed to open config file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(ilCore, "Failed to write config file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString ConfigManager::defaultConfigFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/incidentlens/pipeline.json");
}

QJsonObject ConfigManager::toJson(const PipelineConfig& config)
{
    QJsonObject json;
    json.insert(QStringLiteral("thresholdFloor"), config.relevance.thresholdFloor);
    json.insert(QStringLiteral("thresholdMultiplier"), config.relevance.thresholdMultiplier);
    json.insert(QStringLiteral("keywordMatchRatio"), config.relevance.keywordMatchRatio);
    json.insert(QStringLiteral("minKeywordLength"), config.relevance.minKeywordLength);
    json.insert(QStringLiteral("topResolvers"), config.aggregation.topResolvers);
    json.insert(QStringLiteral("topAssignmentGroups"), config.aggregation.topAssignmentGroups);
    json.insert(QStringLiteral("topCiClasses"), config.aggregation.topCiClasses);
    json.insert(QStringLiteral("retrievalLimit"), config.retrievalLimit);
    json.insert(QStringLiteral("payloadSchema"), config.payloadSchema);
    return json;
}

std::optional<PipelineConfig> ConfigManager::fromJson(const QJsonObject& json, QString* errorOut)
{
    PipelineConfig config;

    const bool ok =
        readDouble(json, QStringLiteral("thresholdFloor"),
                   &config.relevance.thresholdFloor, errorOut)
        && readDouble(json, QStringLiteral("thresholdMultiplier"),
                      &config.relevance.thresholdMultiplier, errorOut)
        && readDouble(json, QStringLiteral("keywordMatchRatio"),
                      &config.relevance.keywordMatchRatio, errorOut)
        && readInt(json, QStringLiteral("minKeywordLength"),
                   &config.relevance.minKeywordLength, errorOut)
        && readInt(json, QStringLiteral("topResolvers"),
                   &config.aggregation.topResolvers, errorOut)
        && readInt(json, QStringLiteral("topAssignmentGroups"),
                   &config.aggregation.topAssignmentGroups, errorOut)
        && readInt(json, QStringLiteral("topCiClasses"),
                   &config.aggregation.topCiClasses, errorOut)
        && readInt(json, QStringLiteral("retrievalLimit"), &config.retrievalLimit, errorOut)
        && readString(json, QStringLiteral("payloadSchema"), &config.payloadSchema, errorOut);

    if (!ok) {
        return std::nullopt;
    }
    return config;
}

} // namespace il
