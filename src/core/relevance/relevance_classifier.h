#pragma once

#include "core/relevance/keyword_matcher.h"
#include "core/relevance/threshold_estimator.h"
#include "core/shared/incident_record.h"

#include <QJsonObject>
#include <QString>

#include <vector>

namespace il {

enum class RelevanceReason {
    Score,           // similarity >= batch threshold
    KeywordOverlap,  // below threshold, rescued by keyword overlap
    Rejected,
};

QString relevanceReasonToString(RelevanceReason reason);

struct RelevanceConfig {
    double thresholdFloor = ThresholdEstimator::kDefaultFloor;
    double thresholdMultiplier = ThresholdEstimator::kDefaultMultiplier;
    double keywordMatchRatio = 0.3;
    int minKeywordLength = KeywordMatcher::kDefaultMinKeywordLength;
};

struct RelevanceDecision {
    QString incidentId;
    RelevanceReason reason = RelevanceReason::Rejected;
    double matchRatio = 0.0;   // 0 when the score alone decided
};

// relevant + nonRelevant partition the input exactly, each in input order.
// decisions has one entry per input record, also in input order.
struct ClassificationResult {
    std::vector<IncidentRecord> relevant;
    std::vector<IncidentRecord> nonRelevant;
    std::vector<RelevanceDecision> decisions;
    double meanScore = 0.0;
    double threshold = 0.0;
};

QJsonObject classificationResultToJson(const ClassificationResult& result);

// RelevanceClassifier -- two-tier relevance split for one query batch.
//
// Per record, in order:
//   1. similarityScore >= threshold               -> relevant (Score)
//   2. keyword match ratio >= keywordMatchRatio   -> relevant (KeywordOverlap)
//   3. otherwise                                  -> non-relevant
// The keyword tier recovers exact-term hits (error codes, host names) the
// embedding ranked low, without lowering the threshold for everyone.
class RelevanceClassifier {
public:
    explicit RelevanceClassifier(const RelevanceConfig& config = {});

    // Estimates the threshold from the batch, then classifies.
    ClassificationResult classify(const std::vector<IncidentRecord>& records,
                                  const QString& query) const;

    // Classifies against a threshold the caller already estimated.
    ClassificationResult classify(const std::vector<IncidentRecord>& records,
                                  const QString& query,
                                  const ThresholdEstimate& estimate) const;

    RelevanceDecision decide(const IncidentRecord& record, double threshold,
                             const KeywordMatcher& matcher) const;

    const RelevanceConfig& config() const { return m_config; }

private:
    RelevanceConfig m_config;
};

} // namespace il
