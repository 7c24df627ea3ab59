#include <QtTest/QtTest>
#include <QFile>
#include <QTemporaryDir>

#include "core/ranking/recommendation_engine.h"
#include "core/taxonomy/category_tree.h"
#include "services/recommender/recommender_service.h"

#include <cmath>

class TestRecommenderService : public QObject {
    Q_OBJECT

private:
    static bool writeFile(const QString& path, const QByteArray& contents)
    {
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            return false;
        }
        return file.write(contents) == contents.size();
    }

    // u1 and u2 both play Portal and Portal 2; only u1 plays Doom.
    // Portal 2 playtimes 200 / 100 give weights 2.5 / 1.5.
    static bool writeFixture(const QTemporaryDir& dir, gr::Settings& settings)
    {
        settings.recordsPath = dir.path() + QStringLiteral("/records.jsonl");
        settings.catalogPath = dir.path() + QStringLiteral("/catalog.json");
        settings.sentimentEnabled = false;

        QByteArray records;
        records += R"({"user_id": "u1", "item_name": "Portal", "playtime_forever": 100, "recommend": true})" "\n";
        records += R"({"user_id": "u1", "item_name": "Portal 2", "playtime_forever": 200, "recommend": true})" "\n";
        records += R"({"user_id": "u1", "item_name": "Doom", "playtime_forever": 50, "recommend": true})" "\n";
        records += R"({"user_id": "u2", "item_name": "Portal", "playtime_forever": 300, "recommend": true})" "\n";
        records += R"({"user_id": "u2", "item_name": "Portal 2", "playtime_forever": 100, "recommend": true})" "\n";
        records += "this line is not json\n";

        const QByteArray catalog = R"([
            {"item_name": "Portal", "genre": ["Puzzle"]},
            {"item_name": "Portal 2", "genre": "Puzzle, Action"},
            {"item_name": "Doom", "genre": ["Action"]},
            {"item_name": "Mystery", "genre": "Unknown"}
        ])";

        return writeFile(settings.recordsPath, records)
            && writeFile(settings.catalogPath, catalog);
    }

private slots:
    void testLoadAndRecommend();
    void testBuildReport();
    void testRepeatedQueryServedFromCache();
    void testHistoryRecordsDistinctQueries();
    void testUnknownItemGivesEmptyResult();
    void testMissingInputFilesFail();
    void testRecommendBeforeLoad();
    void testUnfilteredBaseline();
};

void TestRecommenderService::testLoadAndRecommend()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    gr::Settings settings;
    QVERIFY(writeFixture(tempDir, settings));

    gr::RecommenderService service(settings);
    QVERIFY(service.loadData());
    QVERIFY(service.isLoaded());

    const gr::RecommendationResult result = service.recommend(QStringLiteral("Portal"));

    // Doom is Action only and shares no category with Portal.
    QCOMPARE(result.rankedItems, QStringList({QStringLiteral("Portal 2")}));
    const gr::CandidateScore candidate = result.breakdown.value(QStringLiteral("Portal 2"));
    QCOMPARE(candidate.rawScore, 4.0);
    QCOMPARE(candidate.supportCount, 2);
    QCOMPARE(result.scores.value(QStringLiteral("Portal 2")), 4.0 / std::log(3.0) * 1.5);
    QCOMPARE(result.categories.value(QStringLiteral("Portal 2")),
             QSet<QString>({QStringLiteral("Puzzle"), QStringLiteral("Action")}));
}

void TestRecommenderService::testBuildReport()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    gr::Settings settings;
    QVERIFY(writeFixture(tempDir, settings));

    gr::RecommenderService service(settings);
    QVERIFY(service.loadData());

    const gr::BuildReport& report = service.buildReport();
    QCOMPARE(report.recordsProcessed, 5);
    QCOMPARE(report.recordsSkipped, 1);
    QCOMPARE(report.userCount, 2);
    QCOMPARE(report.itemCount, 3);
    QCOMPARE(report.edgeCount, 5);

    QVERIFY(service.tree() != nullptr);
    QVERIFY(service.tree()->hasIndex());
    QVERIFY(service.tree()->contains(QStringLiteral("Mystery")));
    QVERIFY(service.tree()->categoriesOf(QStringLiteral("Mystery")).isEmpty());
}

void TestRecommenderService::testRepeatedQueryServedFromCache()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    gr::Settings settings;
    QVERIFY(writeFixture(tempDir, settings));

    gr::RecommenderService service(settings);
    QVERIFY(service.loadData());

    const gr::RecommendationResult first = service.recommend(QStringLiteral("Portal"), 5, 1.0);
    QCOMPARE(service.cacheStats().misses, uint64_t(1));
    QCOMPARE(service.cacheStats().hits, uint64_t(0));

    const gr::RecommendationResult second = service.recommend(QStringLiteral("Portal"), 5, 1.0);
    QCOMPARE(service.cacheStats().hits, uint64_t(1));
    QCOMPARE(second.rankedItems, first.rankedItems);
    QCOMPARE(second.scores, first.scores);

    // Different parameters are a different entry.
    service.recommend(QStringLiteral("Portal"), 5, 2.0);
    QCOMPARE(service.cacheStats().misses, uint64_t(2));

    // Reloading drops cached results.
    QVERIFY(service.loadData());
    QCOMPARE(service.cacheStats().currentSize, 0);
}

void TestRecommenderService::testHistoryRecordsDistinctQueries()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    gr::Settings settings;
    settings.historyLimit = 2;
    QVERIFY(writeFixture(tempDir, settings));

    gr::RecommenderService service(settings);
    QVERIFY(service.loadData());

    service.recommend(QStringLiteral("Portal"));
    service.recommend(QStringLiteral("Portal"));
    service.recommend(QStringLiteral("Doom"));
    QCOMPARE(service.history().entries(),
             QStringList({QStringLiteral("Portal"), QStringLiteral("Doom")}));

    service.recommend(QStringLiteral("Portal 2"));
    QCOMPARE(service.history().entries(),
             QStringList({QStringLiteral("Doom"), QStringLiteral("Portal 2")}));
}

void TestRecommenderService::testUnknownItemGivesEmptyResult()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    gr::Settings settings;
    QVERIFY(writeFixture(tempDir, settings));

    gr::RecommenderService service(settings);
    QVERIFY(service.loadData());

    QVERIFY(service.recommend(QStringLiteral("Half-Life")).isEmpty());
    QVERIFY(service.recommend(QStringLiteral("u1")).isEmpty());
}

void TestRecommenderService::testMissingInputFilesFail()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    gr::Settings settings;
    QVERIFY(writeFixture(tempDir, settings));

    gr::Settings noRecords = settings;
    noRecords.recordsPath = tempDir.path() + QStringLiteral("/missing.jsonl");
    gr::RecommenderService first(noRecords);
    QVERIFY(!first.loadData());
    QVERIFY(!first.isLoaded());

    gr::Settings noCatalog = settings;
    noCatalog.catalogPath = tempDir.path() + QStringLiteral("/missing.json");
    gr::RecommenderService second(noCatalog);
    QVERIFY(!second.loadData());
    QVERIFY(!second.isLoaded());
}

void TestRecommenderService::testRecommendBeforeLoad()
{
    gr::RecommenderService service(gr::Settings{});
    QVERIFY(!service.isLoaded());
    QVERIFY(service.recommend(QStringLiteral("Portal")).isEmpty());
    QVERIFY(service.recommendUnfiltered(QStringLiteral("Portal"), 5).isEmpty());
}

void TestRecommenderService::testUnfilteredBaseline()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    gr::Settings settings;
    QVERIFY(writeFixture(tempDir, settings));

    gr::RecommenderService service(settings);
    QVERIFY(service.loadData());

    const gr::RecommendationResult result =
        service.recommendUnfiltered(QStringLiteral("Portal"), 10);
    QVERIFY(result.rankedItems.contains(QStringLiteral("Doom")));
    QVERIFY(result.rankedItems.contains(QStringLiteral("Portal 2")));
}

QTEST_MAIN(TestRecommenderService)
#include "test_recommender_service.moc"
