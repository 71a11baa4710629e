#pragma once

#include <QString>

namespace il {

// Resolution state bucket for a free-form incident state.
enum class StateBucket {
    Closed,   // closed, resolved, done, completed
    Open,     // open, in_progress, assigned, pending, new, active
    Other,    // anything else, including empty
};

// Trims and lower-cases state before matching.
StateBucket classifyState(const QString& state);

QString stateBucketToString(StateBucket bucket);

} // namespace il
