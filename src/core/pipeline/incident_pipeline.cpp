#include "core/pipeline/incident_pipeline.h"
#include "core/shared/logging.h"

namespace il {

QString pipelineOutcomeToString(PipelineOutcome outcome)
{
    switch (outcome) {
    case PipelineOutcome::EmptyResult:      return QStringLiteral("empty");
    case PipelineOutcome::NoRelevantResult: return QStringLiteral("noRelevant");
    case PipelineOutcome::Done:             return QStringLiteral("done");
    }
    return QStringLiteral("unknown");
}

QJsonObject pipelineResultToJson(const PipelineResult& result)
{
    QJsonObject json;
    json.insert(QStringLiteral("outcome"), pipelineOutcomeToString(result.outcome));
    json.insert(QStringLiteral("inputCount"), result.inputCount);
    json.insert(QStringLiteral("skippedCount"), result.skippedCount);
    json.insert(QStringLiteral("classification"),
                classificationResultToJson(result.classification));
    json.insert(QStringLiteral("analytics"), analyticsSnapshotToJson(result.analytics));
    return json;
}

std::optional<IncidentPipeline> IncidentPipeline::create(const PipelineConfig& config,
                                                         QString* errorOut)
{
    QString error;
    if (!config.validate(&error)) {
        LOG_ERROR(ilPipeline, "Invalid pipeline configuration: %s", qUtf8Printable(error));
        if (errorOut) {
            *errorOut = error;
        }
        return std::nullopt;
    }

    // validate() already rejected unknown schema names
    const std::optional<PayloadSchema> schema = PayloadSchema::byName(config.payloadSchema);
    return IncidentPipeline(config, *schema);
}

IncidentPipeline::IncidentPipeline(const PipelineConfig& config, const PayloadSchema& schema)
    : m_config(config)
    , m_normalizer(schema)
    , m_estimator(config.relevance.thresholdFloor, config.relevance.thresholdMultiplier)
    , m_classifier(config.relevance)
    , m_aggregator(config.aggregation)
{
}

int IncidentPipeline::retrievedCountFor(int batchSize, std::optional<int> topK) const
{
    if (topK && *topK > 0) {
        return *topK;
    }
    if (m_config.retrievalLimit > 0) {
        return m_config.retrievalLimit;
    }
    return batchSize;
}

PipelineResult IncidentPipeline::run(const std::vector<RawHit>& hits, const QString& query,
                                     std::optional<int> topK) const
{
    PipelineResult result;
    result.inputCount = static_cast<int>(hits.size());

    if (hits.empty()) {
        LOG_DEBUG(ilPipeline, "run: no hits, EmptyResult");
        return result;
    }

    NormalizationResult normalized = m_normalizer.normalize(hits);
    result.skippedCount = normalized.skippedCount;

    if (normalized.records.empty()) {
        LOG_DEBUG(ilPipeline, "run: all %d hits lacked an incident id, EmptyResult",
                  result.inputCount);
        return result;
    }

    classifyAndAggregate(result, normalized.records, query, topK);
    return result;
}

PipelineResult IncidentPipeline::runRecords(const std::vector<IncidentRecord>& records,
                                            const QString& query,
                                            std::optional<int> topK) const
{
    PipelineResult result;
    result.inputCount = static_cast<int>(records.size());

    if (records.empty()) {
        LOG_DEBUG(ilPipeline, "runRecords: no records, EmptyResult");
        return result;
    }

    classifyAndAggregate(result, records, query, topK);
    return result;
}

void IncidentPipeline::classifyAndAggregate(PipelineResult& result,
                                            const std::vector<IncidentRecord>& records,
                                            const QString& query,
                                            std::optional<int> topK) const
{
    const ThresholdEstimate estimate = m_estimator.estimate(records);
    result.classification = m_classifier.classify(records, query, estimate);

    if (result.classification.relevant.empty()) {
        LOG_WARN(ilPipeline,
                 "run: none of %d records relevant (threshold %.3f), NoRelevantResult",
                 static_cast<int>(records.size()), estimate.threshold);
        result.outcome = PipelineOutcome::NoRelevantResult;
        return;
    }

    const int retrieved = retrievedCountFor(static_cast<int>(records.size()), topK);
    result.analytics = m_aggregator.aggregate(result.classification.relevant, retrieved);
    result.outcome = PipelineOutcome::Done;

    LOG_DEBUG(ilPipeline, "run: Done, %d relevant of %d retrieved",
              result.analytics.relatedCount, result.analytics.totalRetrieved);
}

} // namespace il
