#pragma once

#include "core/shared/incident_record.h"

#include <QByteArray>
#include <QJsonArray>
#include <QString>

#include <optional>
#include <vector>

namespace il {

// Turns a vector-store search response into RawHits, in response order.
//
// Accepted shapes:
//   {"result": [{"id": ..., "score": 0.91, "payload": {...}}, ...]}
//   [{"score": 0.91, "payload": {...}}, ...]
// A hit without a numeric score gets 0.0; a hit without an object payload
// gets an empty one. Only a document that is not JSON, or that has neither
// shape, is an error.
class SearchResponseParser {
public:
    static std::optional<std::vector<RawHit>> parse(const QByteArray& json,
                                                    QString* errorOut = nullptr);

    static std::optional<std::vector<RawHit>> parseFile(const QString& filePath,
                                                        QString* errorOut = nullptr);

    static std::vector<RawHit> hitsFromArray(const QJsonArray& hits);
};

} // namespace il
