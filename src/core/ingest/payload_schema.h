#pragma once

#include <QString>
#include <QStringList>

#include <optional>

namespace il {

// Field mapping from an upstream payload shape onto IncidentRecord.
// Each list is tried in order; the first key holding a non-empty value wins.
struct PayloadSchema {
    QString name;
    QStringList incidentIdKeys;
    QStringList descriptionKeys;
    QStringList closureNotesKeys;
    QStringList assignmentGroupKeys;
    QStringList ciClassKeys;
    QStringList resolvedByKeys;
    QStringList stateKeys;
    QStringList jobNameKeys;
    QStringList impactKeys;
    QStringList assignedToKeys;
    QStringList configurationItemKeys;
    QStringList openedByKeys;
    QStringList closedByKeys;
    QStringList openedTimeKeys;
    QStringList resolvedTimeKeys;
    QStringList closedTimeKeys;
    QStringList priorityKeys;
    QStringList urgencyKeys;

    // Payloads keyed by "number"/"description".
    static PayloadSchema current();
    // Payloads keyed by "incident_number"/"incident_description".
    static PayloadSchema legacy();
    // Accepts either shape, preferring the current keys.
    static PayloadSchema automatic();

    // Lookup by configuration name ("current", "legacy", "auto").
    static std::optional<PayloadSchema> byName(const QString& name);
    static QStringList knownNames();
};

} // namespace il
