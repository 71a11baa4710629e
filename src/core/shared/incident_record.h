#pragma once

#include <QJsonObject>
#include <QString>

namespace il {

// One vector-store hit as handed over by the retrieval layer: the stored
// payload (heterogeneous JSON values) plus the similarity score it scored.
struct RawHit {
    QJsonObject payload;
    double score = 0.0;
};

// Canonical incident record. Every string field is present (empty when the
// upstream payload lacked it); incidentId is never empty once normalized.
struct IncidentRecord {
    QString incidentId;
    QString description;
    QString closureNotes;
    QString assignmentGroup;
    QString ciClass;
    QString resolvedBy;
    QString state;

    // Carried through for the prompt/rendering layer, unused by the core
    QString jobName;
    QString impact;
    QString assignedTo;
    QString configurationItem;
    QString openedBy;
    QString closedBy;
    QString openedTime;
    QString resolvedTime;
    QString closedTime;
    QString priority;
    QString urgency;

    double similarityScore = 0.0;
};

QJsonObject incidentRecordToJson(const IncidentRecord& record);

} // namespace il
