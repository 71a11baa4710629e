#pragma once

#include "core/analytics/ranked_counter.h"
#include "core/analytics/state_bucket.h"
#include "core/shared/incident_record.h"

#include <QJsonObject>

#include <optional>
#include <vector>

namespace il {

// Top-N cutoffs per aggregation dimension.
struct AggregationConfig {
    int topResolvers = 10;
    int topAssignmentGroups = 8;
    int topCiClasses = 6;
};

struct StateCounts {
    int closed = 0;
    int open = 0;
    int other = 0;

    int total() const { return closed + open + other; }
    int countFor(StateBucket bucket) const;
};

// Aggregated view over the relevant incidents of one query. A
// default-constructed snapshot is the "no data" snapshot: every count zero.
struct AnalyticsSnapshot {
    StateCounts states;
    std::vector<CountEntry> topResolvers;
    std::vector<CountEntry> topAssignmentGroups;
    std::vector<CountEntry> topCiClasses;

    int relatedCount = 0;
    int nonRelatedCount = 0;
    int totalRetrieved = 0;
    double resolutionRatePercent = 0.0;   // one decimal place
    int activeTeamCount = 0;              // entries in topAssignmentGroups
    int ciClassCount = 0;                 // entries in topCiClasses

    bool hasData() const { return relatedCount > 0; }
};

QJsonObject analyticsSnapshotToJson(const AnalyticsSnapshot& snapshot);

// Rounds closed / related * 100 to one decimal; 0 when related is 0.
double resolutionRatePercent(int closedCount, int relatedCount);

class AnalyticsAggregator {
public:
    explicit AnalyticsAggregator(const AggregationConfig& config = {});

    // retrievedCount is the size of the batch the relevant records came
    // from; nonRelatedCount is max(retrievedCount - relevant, 0), or 0
    // when it is not supplied.
    AnalyticsSnapshot aggregate(const std::vector<IncidentRecord>& relevant,
                                std::optional<int> retrievedCount = std::nullopt) const;

    const AggregationConfig& config() const { return m_config; }

private:
    AggregationConfig m_config;
};

} // namespace il
