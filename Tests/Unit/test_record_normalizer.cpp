#include <QtTest/QtTest>

#include "core/ingest/payload_schema.h"
#include "core/ingest/record_normalizer.h"

#include <QJsonArray>
#include <QJsonObject>

namespace {

il::RawHit makeHit(const QJsonObject& payload, double score)
{
    il::RawHit hit;
    hit.payload = payload;
    hit.score = score;
    return hit;
}

} // namespace

class TestRecordNormalizer : public QObject {
    Q_OBJECT

private slots:
    // ── Field mapping ────────────────────────────────────────────
    void testCurrentPayloadFullyMapped();
    void testMissingFieldsDefaultToEmpty();
    void testScorePassesThroughUnmodified();
    void testNonStringValuesConverted();

    // ── Identifier handling ──────────────────────────────────────
    void testHitWithoutIdentifierSkipped();
    void testBlankIdentifierSkipped();
    void testFalsyIdentifierSkipped();
    void testSkipCountReportedAndOrderPreserved();

    // ── Schemas ──────────────────────────────────────────────────
    void testLegacySchemaKeys();
    void testCurrentSchemaIgnoresLegacyKeys();
    void testAutoSchemaPrefersCurrentKeys();
    void testSchemaLookupByName();
};

// ── Field mapping ────────────────────────────────────────────────

void TestRecordNormalizer::testCurrentPayloadFullyMapped()
{
    QJsonObject payload;
    payload.insert(QStringLiteral("number"), QStringLiteral("INC0010001"));
    payload.insert(QStringLiteral("description"), QStringLiteral("Database outage on db-prod-01"));
    payload.insert(QStringLiteral("closure_notes"), QStringLiteral("Restarted the listener"));
    payload.insert(QStringLiteral("assignment_group"), QStringLiteral("DBA Team"));
    payload.insert(QStringLiteral("ci_class"), QStringLiteral("Database"));
    payload.insert(QStringLiteral("resolved_by"), QStringLiteral("Alice"));
    payload.insert(QStringLiteral("state"), QStringLiteral("Closed"));
    payload.insert(QStringLiteral("job_name"), QStringLiteral("nightly_etl"));
    payload.insert(QStringLiteral("impact"), QStringLiteral("2 - Medium"));
    payload.insert(QStringLiteral("assigned_to"), QStringLiteral("Bob"));
    payload.insert(QStringLiteral("configuration_item"), QStringLiteral("db-prod-01"));
    payload.insert(QStringLiteral("opened_by"), QStringLiteral("Carol"));
    payload.insert(QStringLiteral("closed_by"), QStringLiteral("Dave"));
    payload.insert(QStringLiteral("opened_time"), QStringLiteral("2024-03-01 10:00:00"));
    payload.insert(QStringLiteral("resolved"), QStringLiteral("2024-03-01 12:00:00"));
    payload.insert(QStringLiteral("closed"), QStringLiteral("2024-03-02 09:00:00"));
    payload.insert(QStringLiteral("priority"), QStringLiteral("2 - High"));
    payload.insert(QStringLiteral("urgency"), QStringLiteral("1 - High"));

    const il::RecordNormalizer normalizer(il::PayloadSchema::current());
    const auto record = normalizer.normalizeHit(makeHit(payload, 0.87));
    QVERIFY(record.has_value());

    QCOMPARE(record->incidentId, QStringLiteral("INC0010001"));
    QCOMPARE(record->description, QStringLiteral("Database outage on db-prod-01"));
    QCOMPARE(record->closureNotes, QStringLiteral("Restarted the listener"));
    QCOMPARE(record->assignmentGroup, QStringLiteral("DBA Team"));
    QCOMPARE(record->ciClass, QStringLiteral("Database"));
    QCOMPARE(record->resolvedBy, QStringLiteral("Alice"));
    QCOMPARE(record->state, QStringLiteral("Closed"));
    QCOMPARE(record->jobName, QStringLiteral("nightly_etl"));
    QCOMPARE(record->impact, QStringLiteral("2 - Medium"));
    QCOMPARE(record->assignedTo, QStringLiteral("Bob"));
    QCOMPARE(record->configurationItem, QStringLiteral("db-prod-01"));
    QCOMPARE(record->openedBy, QStringLiteral("Carol"));
    QCOMPARE(record->closedBy, QStringLiteral("Dave"));
    QCOMPARE(record->openedTime, QStringLiteral("2024-03-01 10:00:00"));
    QCOMPARE(record->resolvedTime, QStringLiteral("2024-03-01 12:00:00"));
    QCOMPARE(record->closedTime, QStringLiteral("2024-03-02 09:00:00"));
    QCOMPARE(record->priority, QStringLiteral("2 - High"));
    QCOMPARE(record->urgency, QStringLiteral("1 - High"));
}

void TestRecordNormalizer::testMissingFieldsDefaultToEmpty()
{
    QJsonObject payload;
    payload.insert(QStringLiteral("number"), QStringLiteral("INC1"));

    const il::RecordNormalizer normalizer;
    const auto record = normalizer.normalizeHit(makeHit(payload, 0.5));
    QVERIFY(record.has_value());

    QVERIFY(record->description.isEmpty());
    QVERIFY(record->closureNotes.isEmpty());
    QVERIFY(record->assignmentGroup.isEmpty());
    QVERIFY(record->ciClass.isEmpty());
    QVERIFY(record->resolvedBy.isEmpty());
    QVERIFY(record->state.isEmpty());
    QVERIFY(record->priority.isEmpty());
}

void TestRecordNormalizer::testScorePassesThroughUnmodified()
{
    QJsonObject payload;
    payload.insert(QStringLiteral("number"), QStringLiteral("INC1"));

    const il::RecordNormalizer normalizer;
    QCOMPARE(normalizer.normalizeHit(makeHit(payload, 0.123456789))->similarityScore,
             0.123456789);
    QCOMPARE(normalizer.normalizeHit(makeHit(payload, 0.0))->similarityScore, 0.0);
    QCOMPARE(normalizer.normalizeHit(makeHit(payload, 1.0))->similarityScore, 1.0);
}

void TestRecordNormalizer::testNonStringValuesConverted()
{
    QJsonObject payload;
    payload.insert(QStringLiteral("number"), 10042);
    payload.insert(QStringLiteral("priority"), 2);
    payload.insert(QStringLiteral("impact"), 1.5);
    payload.insert(QStringLiteral("urgency"), true);
    payload.insert(QStringLiteral("state"), QJsonValue(QJsonValue::Null));
    payload.insert(QStringLiteral("ci_class"), QJsonArray{QStringLiteral("a")});
    payload.insert(QStringLiteral("assignment_group"), QJsonObject{});

    const il::RecordNormalizer normalizer;
    const auto record = normalizer.normalizeHit(makeHit(payload, 0.7));
    QVERIFY(record.has_value());
    QCOMPARE(record->incidentId, QStringLiteral("10042"));
    QCOMPARE(record->priority, QStringLiteral("2"));
    QCOMPARE(record->impact, QStringLiteral("1.5"));
    QCOMPARE(record->urgency, QStringLiteral("true"));
    QVERIFY(record->state.isEmpty());
    QVERIFY(record->ciClass.isEmpty());
    QVERIFY(record->assignmentGroup.isEmpty());
}

// ── Identifier handling ──────────────────────────────────────────

void TestRecordNormalizer::testHitWithoutIdentifierSkipped()
{
    QJsonObject payload;
    payload.insert(QStringLiteral("description"), QStringLiteral("orphan"));

    const il::RecordNormalizer normalizer;
    QVERIFY(!normalizer.normalizeHit(makeHit(payload, 0.9)).has_value());
    QVERIFY(!normalizer.normalizeHit(makeHit(QJsonObject{}, 0.9)).has_value());
}

void TestRecordNormalizer::testBlankIdentifierSkipped()
{
    QJsonObject payload;
    payload.insert(QStringLiteral("number"), QStringLiteral("   "));

    const il::RecordNormalizer normalizer;
    QVERIFY(!normalizer.normalizeHit(makeHit(payload, 0.9)).has_value());

    payload.insert(QStringLiteral("number"), QStringLiteral("  INC7  "));
    const auto trimmed = normalizer.normalizeHit(makeHit(payload, 0.9));
    QVERIFY(trimmed.has_value());
    QCOMPARE(trimmed->incidentId, QStringLiteral("INC7"));
}

void TestRecordNormalizer::testFalsyIdentifierSkipped()
{
    const il::RecordNormalizer normalizer;

    QJsonObject boolId;
    boolId.insert(QStringLiteral("number"), false);
    QVERIFY(!normalizer.normalizeHit(makeHit(boolId, 0.9)).has_value());

    QJsonObject trueId;
    trueId.insert(QStringLiteral("number"), true);
    QVERIFY(!normalizer.normalizeHit(makeHit(trueId, 0.9)).has_value());

    QJsonObject zeroId;
    zeroId.insert(QStringLiteral("number"), 0);
    QVERIFY(!normalizer.normalizeHit(makeHit(zeroId, 0.9)).has_value());

    // Falls through to the next identifier key
    QJsonObject fallback;
    fallback.insert(QStringLiteral("number"), false);
    fallback.insert(QStringLiteral("incident_number"), QStringLiteral("INC9"));
    const auto record = normalizer.normalizeHit(makeHit(fallback, 0.9));
    QVERIFY(record.has_value());
    QCOMPARE(record->incidentId, QStringLiteral("INC9"));

    QJsonObject blankThenLegacy;
    blankThenLegacy.insert(QStringLiteral("number"), QStringLiteral("  "));
    blankThenLegacy.insert(QStringLiteral("incident_number"), QStringLiteral("INC5"));
    const auto legacy = normalizer.normalizeHit(makeHit(blankThenLegacy, 0.9));
    QVERIFY(legacy.has_value());
    QCOMPARE(legacy->incidentId, QStringLiteral("INC5"));
}

void TestRecordNormalizer::testSkipCountReportedAndOrderPreserved()
{
    std::vector<il::RawHit> hits;
    hits.push_back(makeHit(QJsonObject{{QStringLiteral("number"), QStringLiteral("INC1")}}, 0.9));
    hits.push_back(makeHit(QJsonObject{{QStringLiteral("description"), QStringLiteral("x")}}, 0.8));
    hits.push_back(makeHit(QJsonObject{{QStringLiteral("number"), QStringLiteral("INC3")}}, 0.7));
    hits.push_back(makeHit(QJsonObject{}, 0.6));

    const il::RecordNormalizer normalizer;
    const il::NormalizationResult result = normalizer.normalize(hits);

    QCOMPARE(result.inputCount, 4);
    QCOMPARE(result.skippedCount, 2);
    QCOMPARE(static_cast<int>(result.records.size()), 2);
    QCOMPARE(result.records[0].incidentId, QStringLiteral("INC1"));
    QCOMPARE(result.records[1].incidentId, QStringLiteral("INC3"));
    QCOMPARE(result.records[1].similarityScore, 0.7);

    const il::NormalizationResult empty = normalizer.normalize({});
    QCOMPARE(empty.inputCount, 0);
    QCOMPARE(empty.skippedCount, 0);
    QVERIFY(empty.records.empty());
}

// ── Schemas ──────────────────────────────────────────────────────

void TestRecordNormalizer::testLegacySchemaKeys()
{
    QJsonObject payload;
    payload.insert(QStringLiteral("incident_number"), QStringLiteral("INC0000042"));
    payload.insert(QStringLiteral("incident_description"), QStringLiteral("VPN drops"));

    const il::RecordNormalizer normalizer(il::PayloadSchema::legacy());
    const auto record = normalizer.normalizeHit(makeHit(payload, 0.8));
    QVERIFY(record.has_value());
    QCOMPARE(record->incidentId, QStringLiteral("INC0000042"));
    QCOMPARE(record->description, QStringLiteral("VPN drops"));
}

void TestRecordNormalizer::testCurrentSchemaIgnoresLegacyKeys()
{
    QJsonObject payload;
    payload.insert(QStringLiteral("incident_number"), QStringLiteral("INC0000042"));

    const il::RecordNormalizer normalizer(il::PayloadSchema::current());
    QVERIFY(!normalizer.normalizeHit(makeHit(payload, 0.8)).has_value());
}

void TestRecordNormalizer::testAutoSchemaPrefersCurrentKeys()
{
    QJsonObject payload;
    payload.insert(QStringLiteral("number"), QStringLiteral("NEW-1"));
    payload.insert(QStringLiteral("incident_number"), QStringLiteral("OLD-1"));
    payload.insert(QStringLiteral("description"), QStringLiteral(""));
    payload.insert(QStringLiteral("incident_description"), QStringLiteral("legacy text"));

    const il::RecordNormalizer normalizer(il::PayloadSchema::automatic());
    const auto record = normalizer.normalizeHit(makeHit(payload, 0.8));
    QVERIFY(record.has_value());
    QCOMPARE(record->incidentId, QStringLiteral("NEW-1"));
    // Empty current key falls through to the legacy key
    QCOMPARE(record->description, QStringLiteral("legacy text"));

    QJsonObject legacyOnly;
    legacyOnly.insert(QStringLiteral("incident"), QStringLiteral("INC-9"));
    QCOMPARE(normalizer.normalizeHit(makeHit(legacyOnly, 0.8))->incidentId,
             QStringLiteral("INC-9"));
}

void TestRecordNormalizer::testSchemaLookupByName()
{
    QCOMPARE(il::PayloadSchema::byName(QStringLiteral("current"))->name, QStringLiteral("current"));
    QCOMPARE(il::PayloadSchema::byName(QStringLiteral("Legacy"))->name, QStringLiteral("legacy"));
    QCOMPARE(il::PayloadSchema::byName(QStringLiteral(" auto "))->name, QStringLiteral("auto"));
    QVERIFY(!il::PayloadSchema::byName(QStringLiteral("v3")).has_value());
    QCOMPARE(il::PayloadSchema::knownNames().size(), 3);
}

QTEST_MAIN(TestRecordNormalizer)
#include "test_record_normalizer.moc"
