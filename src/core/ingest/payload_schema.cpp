#include "core/ingest/payload_schema.h"

namespace il {

namespace {

// Keys that never drifted between upstream snapshots.
PayloadSchema sharedKeys()
{
    PayloadSchema schema;
    schema.closureNotesKeys = {QStringLiteral("closure_notes")};
    schema.assignmentGroupKeys = {QStringLiteral("assignment_group")};
    schema.ciClassKeys = {QStringLiteral("ci_class")};
    schema.resolvedByKeys = {QStringLiteral("resolved_by")};
    schema.stateKeys = {QStringLiteral("state")};
    schema.jobNameKeys = {QStringLiteral("job_name")};
    schema.impactKeys = {QStringLiteral("impact")};
    schema.assignedToKeys = {QStringLiteral("assigned_to")};
    schema.configurationItemKeys = {QStringLiteral("configuration_item")};
    schema.openedByKeys = {QStringLiteral("opened_by")};
    schema.closedByKeys = {QStringLiteral("closed_by")};
    schema.openedTimeKeys = {QStringLiteral("opened_time")};
    schema.resolvedTimeKeys = {QStringLiteral("resolved")};
    schema.closedTimeKeys = {QStringLiteral("closed")};
    schema.priorityKeys = {QStringLiteral("priority")};
    schema.urgencyKeys = {QStringLiteral("urgency")};
    return schema;
}

} // namespace

PayloadSchema PayloadSchema::current()
{
    PayloadSchema schema = sharedKeys();
    schema.name = QStringLiteral("current");
    schema.incidentIdKeys = {QStringLiteral("number")};
    schema.descriptionKeys = {QStringLiteral("description")};
    return schema;
}

PayloadSchema PayloadSchema::legacy()
{
    PayloadSchema schema = sharedKeys();
    schema.name = QStringLiteral("legacy");
    schema.incidentIdKeys = {QStringLiteral("incident_number")};
    schema.descriptionKeys = {QStringLiteral("incident_description")};
    return schema;
}

PayloadSchema PayloadSchema::automatic()
{
    PayloadSchema schema = sharedKeys();
    schema.name = QStringLiteral("auto");
    schema.incidentIdKeys = {QStringLiteral("number"),
                             QStringLiteral("incident_number"),
                             QStringLiteral("incident")};
    schema.descriptionKeys = {QStringLiteral("description"),
                              QStringLiteral("incident_description")};
    return schema;
}

std::optional<PayloadSchema> PayloadSchema::byName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("current")) return current();
    if (key == QLatin1String("legacy"))  return legacy();
    if (key == QLatin1String("auto"))    return automatic();
    return std::nullopt;
}

QStringList PayloadSchema::knownNames()
{
    return {QStringLiteral("current"), QStringLiteral("legacy"), QStringLiteral("auto")};
}

} // namespace il
