#include "core/analytics/analytics_aggregator.h"
#include "core/shared/logging.h"

#include <QJsonArray>

#include <algorithm>
#include <cmath>

namespace il {

namespace {

QJsonArray countEntriesToJson(const std::vector<CountEntry>& entries)
{
    QJsonArray array;
    for (const CountEntry& entry : entries) {
        QJsonObject item;
        item.insert(QStringLiteral("key"), entry.key);
        item.insert(QStringLiteral("count"), entry.count);
        array.append(item);
    }
    return array;
}

} // namespace

int StateCounts::countFor(StateBucket bucket) const
{
    switch (bucket) {
    case StateBucket::Closed: return closed;
    case StateBucket::Open:   return open;
    case StateBucket::Other:  return other;
    }
    return 0;
}

QJsonObject analyticsSnapshotToJson(const AnalyticsSnapshot& snapshot)
{
    QJsonObject states;
    states.insert(stateBucketToString(StateBucket::Closed), snapshot.states.closed);
    states.insert(stateBucketToString(StateBucket::Open), snapshot.states.open);
    states.insert(stateBucketToString(StateBucket::Other), snapshot.states.other);

    QJsonObject json;
    json.insert(QStringLiteral("states"), states);
    json.insert(QStringLiteral("topResolvers"), countEntriesToJson(snapshot.topResolvers));
    json.insert(QStringLiteral("topAssignmentGroups"),
                countEntriesToJson(snapshot.topAssignmentGroups));
    json.insert(QStringLiteral("topCiClasses"), countEntriesToJson(snapshot.topCiClasses));
    json.insert(QStringLiteral("relatedCount"), snapshot.relatedCount);
    json.insert(QStringLiteral("nonRelatedCount"), snapshot.nonRelatedCount);
    json.insert(QStringLiteral("totalRetrieved"), snapshot.totalRetrieved);
    json.insert(QStringLiteral("resolutionRatePercent"), snapshot.resolutionRatePercent);
    json.insert(QStringLiteral("activeTeamCount"), snapshot.activeTeamCount);
    json.insert(QStringLiteral("ciClassCount"), snapshot.ciClassCount);
    return json;
}

double resolutionRatePercent(int closedCount, int relatedCount)
{
    if (relatedCount <= 0) {
        return 0.0;
    }
    const double percent = static_cast<double>(closedCount)
        / static_cast<double>(relatedCount) * 100.0;
    return std::round(percent * 10.0) / 10.0;
}

AnalyticsAggregator::AnalyticsAggregator(const AggregationConfig& config)
    : m_config(config)
{
}

AnalyticsSnapshot AnalyticsAggregator::aggregate(const std::vector<IncidentRecord>& relevant,
                                                 std::optional<int> retrievedCount) const
{
    // Fresh counters per call; nothing is shared between runs.
    RankedCounter resolvers;
    RankedCounter assignmentGroups;
    RankedCounter ciClasses;

    AnalyticsSnapshot snapshot;

    for (const IncidentRecord& record : relevant) {
        const QString resolvedBy = record.resolvedBy.trimmed();
        const QString assignmentGroup = record.assignmentGroup.trimmed();
        const QString ciClass = record.ciClass.trimmed();

        switch (classifyState(record.state)) {
        case StateBucket::Closed:
            ++snapshot.states.closed;
            // Resolution credit needs both a closed state and an attribution
            if (!resolvedBy.isEmpty()) {
                resolvers.add(resolvedBy);
            }
            break;
        case StateBucket::Open:
            ++snapshot.states.open;
            break;
        case StateBucket::Other:
            ++snapshot.states.other;
            break;
        }

        if (!assignmentGroup.isEmpty()) {
            assignmentGroups.add(assignmentGroup);
        }
        if (!ciClass.isEmpty()) {
            ciClasses.add(ciClass);
        }
    }

    snapshot.topResolvers = resolvers.top(m_config.topResolvers);
    snapshot.topAssignmentGroups = assignmentGroups.top(m_config.topAssignmentGroups);
    snapshot.topCiClasses = ciClasses.top(m_config.topCiClasses);

    snapshot.relatedCount = static_cast<int>(relevant.size());
    snapshot.nonRelatedCount = retrievedCount
        ? std::max(*retrievedCount - snapshot.relatedCount, 0)
        : 0;
    snapshot.totalRetrieved = snapshot.relatedCount + snapshot.nonRelatedCount;
    snapshot.resolutionRatePercent =
        resolutionRatePercent(snapshot.states.closed, snapshot.relatedCount);
    snapshot.activeTeamCount = static_cast<int>(snapshot.topAssignmentGroups.size());
    snapshot.ciClassCount = static_cast<int>(snapshot.topCiClasses.size());

    LOG_DEBUG(ilAnalytics,
              "aggregate: related=%d closed=%d open=%d other=%d resolvers=%d groups=%d ciClasses=%d",
              snapshot.relatedCount, snapshot.states.closed, snapshot.states.open,
              snapshot.states.other, resolvers.size(), assignmentGroups.size(),
              ciClasses.size());
    return snapshot;
}

} // namespace il
