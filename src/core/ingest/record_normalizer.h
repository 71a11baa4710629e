#pragma once

#include "core/ingest/payload_schema.h"
#include "core/shared/incident_record.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace il {

struct NormalizationResult {
    std::vector<IncidentRecord> records;
    int inputCount = 0;
    int skippedCount = 0;   // hits dropped for lack of an identifier
};

// RecordNormalizer -- maps raw retrieval hits onto canonical IncidentRecords.
//
// Missing fields default to empty strings and the score passes through
// unmodified. A hit whose payload yields no identifier is skipped, never
// treated as a batch failure; the skip count is reported in the result.
class RecordNormalizer {
public:
    explicit RecordNormalizer(PayloadSchema schema = PayloadSchema::automatic());

    NormalizationResult normalize(const std::vector<RawHit>& hits) const;

    // Returns nullopt when the payload has no usable identifier.
    std::optional<IncidentRecord> normalizeHit(const RawHit& hit) const;

    // First non-empty textual value among keys, or an empty string.
    static QString payloadString(const QJsonObject& payload, const QStringList& keys);

    const PayloadSchema& schema() const { return m_schema; }

private:
    PayloadSchema m_schema;
};

} // namespace il
