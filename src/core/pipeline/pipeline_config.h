#pragma once

#include "core/analytics/analytics_aggregator.h"
#include "core/relevance/relevance_classifier.h"

#include <QString>

namespace il {

struct PipelineConfig {
    // Threshold floor/multiplier, keyword ratio cutoff, keyword length
    RelevanceConfig relevance;

    // Top-N cutoffs for resolvers, assignment groups, CI classes
    AggregationConfig aggregation;

    // Hits requested from the vector store (top_k). 0 means unknown, in
    // which case the normalized batch size stands in for it.
    int retrievalLimit = 0;

    // Payload field mapping: "current", "legacy" or "auto"
    QString payloadSchema = QStringLiteral("auto");

    // Returns false and names the first offending field on invalid values.
    bool validate(QString* errorOut = nullptr) const;
};

} // namespace il
