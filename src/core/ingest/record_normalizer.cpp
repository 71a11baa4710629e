#include "core/ingest/record_normalizer.h"
#include "core/shared/logging.h"

#include <QJsonValue>

#include <cmath>
#include <utility>

namespace il {

namespace {

// Scalars become text; null, arrays and objects count as absent.
QString jsonValueToText(const QJsonValue& value)
{
    switch (value.type()) {
    case QJsonValue::String:
        return value.toString();
    case QJsonValue::Double: {
        const double number = value.toDouble();
        double integral = 0.0;
        if (std::modf(number, &integral) == 0.0 && std::fabs(number) < 9.0e15) {
            return QString::number(static_cast<qint64>(integral));
        }
        return QString::number(number, 'g', 15);
    }
    case QJsonValue::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Null:
    case QJsonValue::Array:
    case QJsonValue::Object:
    case QJsonValue::Undefined:
        break;
    }
    return QString();
}

// Booleans and numeric zero never identify an incident.
QString identifierString(const QJsonObject& payload, const QStringList& keys)
{
    for (const QString& key : keys) {
        const auto it = payload.constFind(key);
        if (it == payload.constEnd()) {
            continue;
        }
        const QJsonValue value = it.value();
        if (value.isBool() || (value.isDouble() && value.toDouble() == 0.0)) {
            continue;
        }
        QString text = jsonValueToText(value).trimmed();
        if (!text.isEmpty()) {
            return text;
        }
    }
    return QString();
}

} // namespace

RecordNormalizer::RecordNormalizer(PayloadSchema schema)
    : m_schema(std::move(schema))
{
}

QString RecordNormalizer::payloadString(const QJsonObject& payload, const QStringList& keys)
{
    for (const QString& key : keys) {
        const auto it = payload.constFind(key);
        if (it == payload.constEnd()) {
            continue;
        }
        QString text = jsonValueToText(it.value());
        if (!text.isEmpty()) {
            return text;
        }
    }
    return QString();
}

std::optional<IncidentRecord> RecordNormalizer::normalizeHit(const RawHit& hit) const
{
    const QJsonObject& payload = hit.payload;

    const QString incidentId = identifierString(payload, m_schema.incidentIdKeys);
    if (incidentId.isEmpty()) {
        return std::nullopt;
    }

    IncidentRecord record;
    record.incidentId = incidentId;
    record.description = payloadString(payload, m_schema.descriptionKeys);
    record.closureNotes = payloadString(payload, m_schema.closureNotesKeys);
    record.assignmentGroup = payloadString(payload, m_schema.assignmentGroupKeys);
    record.ciClass = payloadString(payload, m_schema.ciClassKeys);
    record.resolvedBy = payloadString(payload, m_schema.resolvedByKeys);
    record.state = payloadString(payload, m_schema.stateKeys);
    record.jobName = payloadString(payload, m_schema.jobNameKeys);
    record.impact = payloadString(payload, m_schema.impactKeys);
    record.assignedTo = payloadString(payload, m_schema.assignedToKeys);
    record.configurationItem = payloadString(payload, m_schema.configurationItemKeys);
    record.openedBy = payloadString(payload, m_schema.openedByKeys);
    record.closedBy = payloadString(payload, m_schema.closedByKeys);
    record.openedTime = payloadString(payload, m_schema.openedTimeKeys);
    record.resolvedTime = payloadString(payload, m_schema.resolvedTimeKeys);
    record.closedTime = payloadString(payload, m_schema.closedTimeKeys);
    record.priority = payloadString(payload, m_schema.priorityKeys);
    record.urgency = payloadString(payload, m_schema.urgencyKeys);
    record.similarityScore = hit.score;
    return record;
}

NormalizationResult RecordNormalizer::normalize(const std::vector<RawHit>& hits) const
{
    NormalizationResult result;
    result.inputCount = static_cast<int>(hits.size());
    result.records.reserve(hits.size());

    for (size_t i = 0; i < hits.size(); ++i) {
        std::optional<IncidentRecord> record = normalizeHit(hits[i]);
        if (!record) {
            ++result.skippedCount;
            LOG_DEBUG(ilIngest, "normalize: skipping hit %d (schema '%s'), no incident id",
                      static_cast<int>(i), qUtf8Printable(m_schema.name));
            continue;
        }
        result.records.push_back(std::move(*record));
    }

    if (result.skippedCount > 0) {
        LOG_INFO(ilIngest, "normalize: skipped %d of %d hits without an incident id",
                 result.skippedCount, result.inputCount);
    }
    return result;
}

} // namespace il
