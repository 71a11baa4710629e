#include "core/relevance/threshold_estimator.h"

#include <algorithm>

namespace il {

ThresholdEstimator::ThresholdEstimator(double floor, double multiplier)
    : m_floor(floor)
    , m_multiplier(multiplier)
{
}

ThresholdEstimate ThresholdEstimator::estimate(const std::vector<double>& scores) const
{
    ThresholdEstimate result;
    if (scores.empty()) {
        result.threshold = m_floor;
        return result;
    }

    double sum = 0.0;
    for (double score : scores) {
        sum += score;
    }
    result.meanScore = sum / static_cast<double>(scores.size());
    result.threshold = std::max(result.meanScore * m_multiplier, m_floor);
    return result;
}

ThresholdEstimate ThresholdEstimator::estimate(const std::vector<IncidentRecord>& records) const
{
    std::vector<double> scores;
    scores.reserve(records.size());
    for (const IncidentRecord& record : records) {
        scores.push_back(record.similarityScore);
    }
    return estimate(scores);
}

} // namespace il
