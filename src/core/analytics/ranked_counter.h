#pragma once

#include <QHash>
#include <QString>

#include <vector>

namespace il {

struct CountEntry {
    QString key;
    int count = 0;
};

// Occurrence counter that remembers first-seen order, so ranking breaks
// count ties in favour of the key encountered first.
class RankedCounter {
public:
    void add(const QString& key, int amount = 1);

    int count(const QString& key) const;
    int size() const { return static_cast<int>(m_entries.size()); }
    bool isEmpty() const { return m_entries.empty(); }
    int total() const;

    // Entries in first-seen order.
    const std::vector<CountEntry>& entries() const { return m_entries; }

    // Count descending, first-seen order on ties, at most limit entries.
    // A negative limit returns every entry.
    std::vector<CountEntry> top(int limit) const;

private:
    std::vector<CountEntry> m_entries;
    QHash<QString, int> m_indexByKey;
};

} // namespace il
