#include "core/relevance/keyword_matcher.h"

#include <QSet>
#include <QStringList>

#include <algorithm>

namespace il {

KeywordMatcher::KeywordMatcher(const QString& query, int minKeywordLength)
    : m_keywords(extractKeywords(query, minKeywordLength))
{
}

std::vector<QString> KeywordMatcher::extractKeywords(const QString& query, int minKeywordLength)
{
    std::vector<QString> keywords;
    QSet<QString> seen;

    const QStringList words = query.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString& word : words) {
        // Length in code points, not UTF-16 units
        if (word.toUcs4().size() < minKeywordLength) {
            continue;
        }
        const QString lowered = word.toLower();
        if (seen.contains(lowered)) {
            continue;
        }
        seen.insert(lowered);
        keywords.push_back(lowered);
    }
    return keywords;
}

QString KeywordMatcher::searchText(const IncidentRecord& record)
{
    return (record.description + QLatin1Char(' ') + record.closureNotes).toLower();
}

int KeywordMatcher::countMatches(const QString& searchTextLower) const
{
    return static_cast<int>(std::count_if(
        m_keywords.begin(), m_keywords.end(),
        [&searchTextLower](const QString& keyword) {
            return searchTextLower.contains(keyword);
        }));
}

double KeywordMatcher::matchRatio(const IncidentRecord& record) const
{
    if (m_keywords.empty()) {
        return 0.0;
    }
    const int matches = countMatches(searchText(record));
    return static_cast<double>(matches) / static_cast<double>(m_keywords.size());
}

} // namespace il
