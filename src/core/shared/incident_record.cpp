#include "core/shared/incident_record.h"

namespace il {

QJsonObject incidentRecordToJson(const IncidentRecord& record)
{
    QJsonObject json;
    json.insert(QStringLiteral("incidentId"), record.incidentId);
    json.insert(QStringLiteral("description"), record.description);
    json.insert(QStringLiteral("closureNotes"), record.closureNotes);
    json.insert(QStringLiteral("assignmentGroup"), record.assignmentGroup);
    json.insert(QStringLiteral("ciClass"), record.ciClass);
    json.insert(QStringLiteral("resolvedBy"), record.resolvedBy);
    json.insert(QStringLiteral("state"), record.state);
    json.insert(QStringLiteral("jobName"), record.jobName);
    json.insert(QStringLiteral("impact"), record.impact);
    json.insert(QStringLiteral("assignedTo"), record.assignedTo);
    json.insert(QStringLiteral("configurationItem"), record.configurationItem);
    json.insert(QStringLiteral("openedBy"), record.openedBy);
    json.insert(QStringLiteral("closedBy"), record.closedBy);
    json.insert(QStringLiteral("openedTime"), record.openedTime);
    json.insert(QStringLiteral("resolvedTime"), record.resolvedTime);
    json.insert(QStringLiteral("closedTime"), record.closedTime);
    json.insert(QStringLiteral("priority"), record.priority);
    json.insert(QStringLiteral("urgency"), record.urgency);
    json.insert(QStringLiteral("similarityScore"), record.similarityScore);
    return json;
}

} // namespace il
