#pragma once

#include "core/shared/incident_record.h"

#include <QString>

#include <vector>

namespace il {

// Keyword-overlap measure between a query and an incident's free text.
//
// Keywords are the query's whitespace-separated words, lower-cased, at least
// minKeywordLength characters long, de-duplicated in first-seen order. A
// keyword matches when it occurs as a substring of the lower-cased
// "description closure_notes" text.
class KeywordMatcher {
public:
    static constexpr int kDefaultMinKeywordLength = 3;

    explicit KeywordMatcher(const QString& query,
                            int minKeywordLength = kDefaultMinKeywordLength);

    static std::vector<QString> extractKeywords(const QString& query, int minKeywordLength);

    // Lower-cased description and closure notes joined by a space.
    static QString searchText(const IncidentRecord& record);

    int countMatches(const QString& searchTextLower) const;

    // matches / max(keywordCount, 1); always 0 for an empty keyword set.
    double matchRatio(const IncidentRecord& record) const;

    const std::vector<QString>& keywords() const { return m_keywords; }

private:
    std::vector<QString> m_keywords;
};

} // namespace il
