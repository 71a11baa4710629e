#pragma once

#include "core/shared/incident_record.h"

#include <vector>

namespace il {

struct ThresholdEstimate {
    double meanScore = 0.0;
    double threshold = 0.0;
};

// Per-batch relevance cutoff: max(mean(scores) * multiplier, floor).
// The floor rejects batches of uniformly weak matches; the relative term
// follows batches that score unusually high. Recomputed for every batch.
class ThresholdEstimator {
public:
    static constexpr double kDefaultFloor = 0.6;
    static constexpr double kDefaultMultiplier = 0.7;

    explicit ThresholdEstimator(double floor = kDefaultFloor,
                                double multiplier = kDefaultMultiplier);

    // An empty batch yields {0.0, floor}; callers normally short-circuit first.
    ThresholdEstimate estimate(const std::vector<double>& scores) const;
    ThresholdEstimate estimate(const std::vector<IncidentRecord>& records) const;

    double floor() const { return m_floor; }
    double multiplier() const { return m_multiplier; }

private:
    double m_floor;
    double m_multiplier;
};

} // namespace il
