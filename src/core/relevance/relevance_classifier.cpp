#include "core/relevance/relevance_classifier.h"
#include "core/shared/logging.h"

#include <QJsonArray>

namespace il {

QString relevanceReasonToString(RelevanceReason reason)
{
    switch (reason) {
    case RelevanceReason::Score:          return QStringLiteral("score");
    case RelevanceReason::KeywordOverlap: return QStringLiteral("keywordOverlap");
    case RelevanceReason::Rejected:       return QStringLiteral("rejected");
    }
    return QStringLiteral("unknown");
}

QJsonObject classificationResultToJson(const ClassificationResult& result)
{
    QJsonArray relevant;
    for (const IncidentRecord& record : result.relevant) {
        relevant.append(incidentRecordToJson(record));
    }

    QJsonArray nonRelevant;
    for (const IncidentRecord& record : result.nonRelevant) {
        nonRelevant.append(incidentRecordToJson(record));
    }

    QJsonArray decisions;
    for (const RelevanceDecision& decision : result.decisions) {
        QJsonObject entry;
        entry.insert(QStringLiteral("incidentId"), decision.incidentId);
        entry.insert(QStringLiteral("reason"), relevanceReasonToString(decision.reason));
        entry.insert(QStringLiteral("matchRatio"), decision.matchRatio);
        decisions.append(entry);
    }

    QJsonObject json;
    json.insert(QStringLiteral("meanScore"), result.meanScore);
    json.insert(QStringLiteral("threshold"), result.threshold);
    json.insert(QStringLiteral("relevant"), relevant);
    json.insert(QStringLiteral("nonRelevant"), nonRelevant);
    json.insert(QStringLiteral("decisions"), decisions);
    return json;
}

RelevanceClassifier::RelevanceClassifier(const RelevanceConfig& config)
    : m_config(config)
{
}

RelevanceDecision RelevanceClassifier::decide(const IncidentRecord& record, double threshold,
                                              const KeywordMatcher& matcher) const
{
    RelevanceDecision decision;
    decision.incidentId = record.incidentId;

    if (record.similarityScore >= threshold) {
        decision.reason = RelevanceReason::Score;
        return decision;
    }

    decision.matchRatio = matcher.matchRatio(record);
    decision.reason = decision.matchRatio >= m_config.keywordMatchRatio
        ? RelevanceReason::KeywordOverlap
        : RelevanceReason::Rejected;
    return decision;
}

ClassificationResult RelevanceClassifier::classify(const std::vector<IncidentRecord>& records,
                                                   const QString& query) const
{
    if (records.empty()) {
        return {};
    }
    const ThresholdEstimator estimator(m_config.thresholdFloor, m_config.thresholdMultiplier);
    return classify(records, query, estimator.estimate(records));
}

ClassificationResult RelevanceClassifier::classify(const std::vector<IncidentRecord>& records,
                                                   const QString& query,
                                                   const ThresholdEstimate& estimate) const
{
    ClassificationResult result;
    result.meanScore = estimate.meanScore;
    result.threshold = estimate.threshold;
    result.decisions.reserve(records.size());

    const KeywordMatcher matcher(query, m_config.minKeywordLength);

    for (const IncidentRecord& record : records) {
        RelevanceDecision decision = decide(record, estimate.threshold, matcher);
        if (decision.reason == RelevanceReason::Rejected) {
            result.nonRelevant.push_back(record);
        } else {
            result.relevant.push_back(record);
        }
        result.decisions.push_back(std::move(decision));
    }

    LOG_DEBUG(ilRelevance,
              "classify: mean=%.3f threshold=%.3f keywords=%d -> %d relevant, %d non-relevant",
              result.meanScore, result.threshold,
              static_cast<int>(matcher.keywords().size()),
              static_cast<int>(result.relevant.size()),
              static_cast<int>(result.nonRelevant.size()));
    return result;
}

} // namespace il
