#include "core/pipeline/pipeline_config.h"
#include "core/ingest/payload_schema.h"

#include <cmath>

namespace il {

namespace {

bool fail(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
    return false;
}

bool inUnitInterval(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

bool PipelineConfig::validate(QString* errorOut) const
{
    if (!inUnitInterval(relevance.thresholdFloor)) {
        return fail(errorOut, QStringLiteral("thresholdFloor must be within [0, 1], got %1")
                                  .arg(relevance.thresholdFloor));
    }
    if (!std::isfinite(relevance.thresholdMultiplier) || relevance.thresholdMultiplier < 0.0) {
        return fail(errorOut, QStringLiteral("thresholdMultiplier must be a non-negative number, got %1")
                                  .arg(relevance.thresholdMultiplier));
    }
    if (!inUnitInterval(relevance.keywordMatchRatio)) {
        return fail(errorOut, QStringLiteral("keywordMatchRatio must be within [0, 1], got %1")
                                  .arg(relevance.keywordMatchRatio));
    }
    if (relevance.minKeywordLength < 1) {
        return fail(errorOut, QStringLiteral("minKeywordLength must be at least 1, got %1")
                                  .arg(relevance.minKeywordLength));
    }
    if (aggregation.topResolvers < 1) {
        return fail(errorOut, QStringLiteral("topResolvers must be at least 1, got %1")
                                  .arg(aggregation.topResolvers));
    }
    if (aggregation.topAssignmentGroups < 1) {
        return fail(errorOut, QStringLiteral("topAssignmentGroups must be at least 1, got %1")
                                  .arg(aggregation.topAssignmentGroups));
    }
    if (aggregation.topCiClasses < 1) {
        return fail(errorOut, QStringLiteral("topCiClasses must be at least 1, got %1")
                                  .arg(aggregation.topCiClasses));
    }
    if (retrievalLimit < 0) {
        return fail(errorOut, QStringLiteral("retrievalLimit must not be negative, got %1")
                                  .arg(retrievalLimit));
    }
    if (!PayloadSchema::byName(payloadSchema)) {
        return fail(errorOut, QStringLiteral("payloadSchema '%1' is not one of: %2")
                                  .arg(payloadSchema,
                                       PayloadSchema::knownNames().join(QStringLiteral(", "))));
    }
    return true;
}

} // namespace il
