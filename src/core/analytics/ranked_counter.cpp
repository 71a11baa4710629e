#include "core/analytics/ranked_counter.h"

#include <algorithm>

namespace il {

void RankedCounter::add(const QString& key, int amount)
{
    const auto it = m_indexByKey.constFind(key);
    if (it != m_indexByKey.constEnd()) {
        m_entries[static_cast<size_t>(it.value())].count += amount;
        return;
    }
    m_indexByKey.insert(key, static_cast<int>(m_entries.size()));
    m_entries.push_back(CountEntry{key, amount});
}

int RankedCounter::count(const QString& key) const
{
    const auto it = m_indexByKey.constFind(key);
    if (it == m_indexByKey.constEnd()) {
        return 0;
    }
    return m_entries[static_cast<size_t>(it.value())].count;
}

int RankedCounter::total() const
{
    int sum = 0;
    for (const CountEntry& entry : m_entries) {
        sum += entry.count;
    }
    return sum;
}

std::vector<CountEntry> RankedCounter::top(int limit) const
{
    std::vector<CountEntry> ranked = m_entries;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const CountEntry& lhs, const CountEntry& rhs) {
                         return lhs.count > rhs.count;
                     });
    if (limit >= 0 && ranked.size() > static_cast<size_t>(limit)) {
        ranked.resize(static_cast<size_t>(limit));
    }
    return ranked;
}

} // namespace il
