#include <QtTest/QtTest>
#include <QBuffer>
#include <QFile>
#include <QTemporaryDir>
#include "core/ingest/record_reader.h"

#include <cmath>

class TestRecordReader : public QObject {
    Q_OBJECT

private slots:
    // ── parseLine ────────────────────────────────────────────────
    void testParseFullRecord();
    void testParsePlaytimeAlias();
    void testMissingPlaytimeDefaultsToZero();
    void testNullOptionalsAreAbsent();
    void testMissingRequiredFieldRejected();
    void testInvalidPlaytimeRejected();
    void testLargePlaytimeInRangeAccepted();
    void testWrongOptionalTypeRejected();
    void testNonObjectRejected();

    // ── read / readFile ──────────────────────────────────────────
    void testReadSkipsMalformedLines();
    void testReadFileNonexistent();
    void testReadFileFromDisk();

    // ── computePlaytimeStats ─────────────────────────────────────
    void testStatsPopulationStd();
    void testStatsSingleObservationHasZeroStd();
    void testStatsIdenticalPlaytimesHaveZeroStd();
};

// ── parseLine ────────────────────────────────────────────────────

void TestRecordReader::testParseFullRecord()
{
    const QByteArray line = R"({"user_id": "u1", "item_id": "400", "item_name": "Portal",
        "playtime_forever": 120, "recommend": true, "review": "Great puzzles"})";

    const auto record = gr::RecordReader::parseLine(line);
    QVERIFY(record.has_value());
    QCOMPARE(record->userId, QStringLiteral("u1"));
    QCOMPARE(record->itemName, QStringLiteral("Portal"));
    QCOMPARE(record->playtime, int64_t(120));
    QVERIFY(record->recommend.has_value());
    QVERIFY(*record->recommend);
    QVERIFY(record->review.has_value());
    QCOMPARE(*record->review, QStringLiteral("Great puzzles"));
}

void TestRecordReader::testParsePlaytimeAlias()
{
    const auto record = gr::RecordReader::parseLine(
        R"({"user_id": "u1", "item_name": "Portal", "playtime": 7})");
    QVERIFY(record.has_value());
    QCOMPARE(record->playtime, int64_t(7));
}

void TestRecordReader::testMissingPlaytimeDefaultsToZero()
{
    const auto record = gr::RecordReader::parseLine(R"({"user_id": "u1", "item_name": "Portal"})");
    QVERIFY(record.has_value());
    QCOMPARE(record->playtime, int64_t(0));
    QVERIFY(!record->recommend.has_value());
    QVERIFY(!record->review.has_value());
}

void TestRecordReader::testNullOptionalsAreAbsent()
{
    const auto record = gr::RecordReader::parseLine(
        R"({"user_id": "u1", "item_name": "Portal", "recommend": null, "review": null})");
    QVERIFY(record.has_value());
    QVERIFY(!record->recommend.has_value());
    QVERIFY(!record->review.has_value());
}

void TestRecordReader::testMissingRequiredFieldRejected()
{
    QString error;
    QVERIFY(!gr::RecordReader::parseLine(R"({"item_name": "Portal"})", &error).has_value());
    QVERIFY(error.contains(QStringLiteral("user_id")));

    QVERIFY(!gr::RecordReader::parseLine(R"({"user_id": "u1"})").has_value());
    QVERIFY(!gr::RecordReader::parseLine(R"({"user_id": "", "item_name": "Portal"})").has_value());
    QVERIFY(!gr::RecordReader::parseLine(R"({"user_id": 12, "item_name": "Portal"})").has_value());
}

void TestRecordReader::testInvalidPlaytimeRejected()
{
    QVERIFY(!gr::RecordReader::parseLine(
        R"({"user_id": "u1", "item_name": "Portal", "playtime_forever": -1})").has_value());
    QVERIFY(!gr::RecordReader::parseLine(
        R"({"user_id": "u1", "item_name": "Portal", "playtime_forever": 1.5})").has_value());
    QVERIFY(!gr::RecordReader::parseLine(
        R"({"user_id": "u1", "item_name": "Portal", "playtime_forever": "10"})").has_value());

    QString error;
    QVERIFY(!gr::RecordReader::parseLine(
        R"({"user_id": "u1", "item_name": "Portal", "playtime_forever": 1e30})", &error).has_value());
    QVERIFY(error.contains(QStringLiteral("out of range")));
    QVERIFY(!gr::RecordReader::parseLine(
        R"({"user_id": "u1", "item_name": "Portal", "playtime_forever": 9223372036854775808})").has_value());
}

void TestRecordReader::testLargePlaytimeInRangeAccepted()
{
    // 2^53 is exactly representable and well inside int64_t.
    const auto record = gr::RecordReader::parseLine(
        R"({"user_id": "u1", "item_name": "Portal", "playtime_forever": 9007199254740992})");
    QVERIFY(record.has_value());
    QCOMPARE(record->playtime, int64_t(9007199254740992LL));
}

void TestRecordReader::testWrongOptionalTypeRejected()
{
    QVERIFY(!gr::RecordReader::parseLine(
        R"({"user_id": "u1", "item_name": "Portal", "recommend": "yes"})").has_value());
    QVERIFY(!gr::RecordReader::parseLine(
        R"({"user_id": "u1", "item_name": "Portal", "review": 5})").has_value());
}

void TestRecordReader::testNonObjectRejected()
{
    QString error;
    QVERIFY(!gr::RecordReader::parseLine("not json", &error).has_value());
    QVERIFY(!error.isEmpty());
    QVERIFY(!gr::RecordReader::parseLine("[1, 2]").has_value());
}

// ── read / readFile ──────────────────────────────────────────────

void TestRecordReader::testReadSkipsMalformedLines()
{
    QByteArray data;
    data += R"({"user_id": "u1", "item_name": "Portal", "playtime_forever": 10})" "\n";
    data += "\n";
    data += "{broken\n";
    data += R"({"user_id": "u2", "item_name": "Portal", "playtime_forever": 30})" "\n";
    data += R"({"item_name": "Portal"})" "\n";

    QBuffer buffer(&data);
    QVERIFY(buffer.open(QIODevice::ReadOnly));

    const gr::RecordReadResult result = gr::RecordReader::read(buffer);
    QCOMPARE(result.linesRead, 4);
    QCOMPARE(result.linesSkipped, 2);
    QCOMPARE(result.records.size(), size_t(2));
    QCOMPARE(result.records[1].userId, QStringLiteral("u2"));
}

void TestRecordReader::testReadFileNonexistent()
{
    QVERIFY(!gr::RecordReader::readFile(QStringLiteral("/nonexistent/records.jsonl")).has_value());
}

void TestRecordReader::testReadFileFromDisk()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString path = tempDir.path() + QStringLiteral("/records.jsonl");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"user_id": "u1", "item_name": "Portal", "recommend": false})" "\n");
    file.write(R"({"user_id": "u1", "item_name": "Portal 2", "review": "fun"})" "\n");
    file.close();

    const auto result = gr::RecordReader::readFile(path);
    QVERIFY(result.has_value());
    QCOMPARE(result->records.size(), size_t(2));
    QCOMPARE(result->linesSkipped, 0);
    QVERIFY(!*result->records[0].recommend);
    QCOMPARE(*result->records[1].review, QStringLiteral("fun"));
}

// ── computePlaytimeStats ─────────────────────────────────────────

void TestRecordReader::testStatsPopulationStd()
{
    std::vector<gr::InteractionRecord> records(3);
    const int64_t playtimes[] = {10, 20, 30};
    for (int i = 0; i < 3; ++i) {
        records[i].userId = QStringLiteral("u%1").arg(i);
        records[i].itemName = QStringLiteral("Portal");
        records[i].playtime = playtimes[i];
    }

    const auto stats = gr::computePlaytimeStats(records);
    QVERIFY(stats.contains(QStringLiteral("Portal")));
    const gr::ItemStats s = stats.value(QStringLiteral("Portal"));
    QCOMPARE(s.sampleCount, 3);
    QCOMPARE(s.meanPlaytime, 20.0);
    QCOMPARE(s.stdPlaytime, std::sqrt(200.0 / 3.0));
}

void TestRecordReader::testStatsSingleObservationHasZeroStd()
{
    std::vector<gr::InteractionRecord> records(1);
    records[0].userId = QStringLiteral("u1");
    records[0].itemName = QStringLiteral("Portal");
    records[0].playtime = 42;

    const gr::ItemStats s = gr::computePlaytimeStats(records).value(QStringLiteral("Portal"));
    QCOMPARE(s.meanPlaytime, 42.0);
    QVERIFY(s.stdPlaytime == 0.0);
}

void TestRecordReader::testStatsIdenticalPlaytimesHaveZeroStd()
{
    std::vector<gr::InteractionRecord> records(5);
    for (int i = 0; i < 5; ++i) {
        records[i].userId = QStringLiteral("u%1").arg(i);
        records[i].itemName = QStringLiteral("Portal");
        records[i].playtime = 77;
    }

    const gr::ItemStats s = gr::computePlaytimeStats(records).value(QStringLiteral("Portal"));
    QVERIFY(s.stdPlaytime == 0.0);
    QCOMPARE(s.meanPlaytime, 77.0);
}

QTEST_MAIN(TestRecordReader)
#include "test_record_reader.moc"
