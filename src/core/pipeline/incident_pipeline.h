#pragma once

#include "core/analytics/analytics_aggregator.h"
#include "core/ingest/record_normalizer.h"
#include "core/pipeline/pipeline_config.h"
#include "core/relevance/relevance_classifier.h"
#include "core/relevance/threshold_estimator.h"
#include "core/shared/incident_record.h"

#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace il {

// Terminal state of one pipeline run.
enum class PipelineOutcome {
    EmptyResult,       // no hits, or none survived normalization
    NoRelevantResult,  // classified, but nothing relevant
    Done,
};

QString pipelineOutcomeToString(PipelineOutcome outcome);

struct PipelineResult {
    PipelineOutcome outcome = PipelineOutcome::EmptyResult;
    int inputCount = 0;
    int skippedCount = 0;
    ClassificationResult classification;
    // All-zero unless outcome == Done
    AnalyticsSnapshot analytics;
};

QJsonObject pipelineResultToJson(const PipelineResult& result);

// IncidentPipeline -- relevance split and analytics for one query.
//
//   Start -> [no hits]         -> EmptyResult
//         -> Normalize -> [no records]  -> EmptyResult
//         -> EstimateThreshold -> Classify -> [none relevant] -> NoRelevantResult
//         -> Aggregate -> Done
//
// Holds only immutable configuration: run() may be called concurrently
// from several threads for independent queries.
class IncidentPipeline {
public:
    // Returns nullopt if the configuration does not validate.
    static std::optional<IncidentPipeline> create(const PipelineConfig& config = {},
                                                  QString* errorOut = nullptr);

    // topK overrides config().retrievalLimit for non_related_count when > 0.
    PipelineResult run(const std::vector<RawHit>& hits, const QString& query,
                       std::optional<int> topK = std::nullopt) const;

    // Entry point for callers that already hold canonical records.
    PipelineResult runRecords(const std::vector<IncidentRecord>& records,
                              const QString& query,
                              std::optional<int> topK = std::nullopt) const;

    const PipelineConfig& config() const { return m_config; }

private:
    IncidentPipeline(const PipelineConfig& config, const PayloadSchema& schema);

    void classifyAndAggregate(PipelineResult& result,
                              const std::vector<IncidentRecord>& records,
                              const QString& query, std::optional<int> topK) const;

    int retrievedCountFor(int batchSize, std::optional<int> topK) const;

    PipelineConfig m_config;
    RecordNormalizer m_normalizer;
    ThresholdEstimator m_estimator;
    RelevanceClassifier m_classifier;
    AnalyticsAggregator m_aggregator;
};

} // namespace il
