#include <QtTest/QtTest>
#include "core/query/search_history.h"

class TestSearchHistory : public QObject {
    Q_OBJECT

private slots:
    void testRecordsInOrder()
    {
        gr::SearchHistory history;
        QVERIFY(history.record(QStringLiteral("Portal")));
        QVERIFY(history.record(QStringLiteral("Dota 2")));
        QCOMPARE(history.entries(),
                 QStringList({QStringLiteral("Portal"), QStringLiteral("Dota 2")}));
        QCOMPARE(history.limit(), 10);
    }

    void testDuplicateKeepsOriginalPosition()
    {
        gr::SearchHistory history;
        history.record(QStringLiteral("Portal"));
        history.record(QStringLiteral("Dota 2"));
        QVERIFY(!history.record(QStringLiteral("  Portal ")));
        QCOMPARE(history.entries(),
                 QStringList({QStringLiteral("Portal"), QStringLiteral("Dota 2")}));
    }

    void testBlankQueryIgnored()
    {
        gr::SearchHistory history;
        QVERIFY(!history.record(QString()));
        QVERIFY(!history.record(QStringLiteral("   ")));
        QCOMPARE(history.size(), 0);
    }

    void testOldestDroppedPastLimit()
    {
        gr::SearchHistory history(2);
        history.record(QStringLiteral("a"));
        history.record(QStringLiteral("b"));
        history.record(QStringLiteral("c"));
        QCOMPARE(history.entries(), QStringList({QStringLiteral("b"), QStringLiteral("c")}));
        QVERIFY(!history.contains(QStringLiteral("a")));

        // A dropped query can be recorded again.
        QVERIFY(history.record(QStringLiteral("a")));
        QCOMPARE(history.entries(), QStringList({QStringLiteral("c"), QStringLiteral("a")}));
    }

    void testZeroLimitKeepsNothing()
    {
        gr::SearchHistory history(0);
        QVERIFY(!history.record(QStringLiteral("Portal")));
        QCOMPARE(history.size(), 0);

        gr::SearchHistory negative(-3);
        QCOMPARE(negative.limit(), 0);
    }

    void testClear()
    {
        gr::SearchHistory history;
        history.record(QStringLiteral("Portal"));
        history.clear();
        QCOMPARE(history.size(), 0);
        QVERIFY(history.record(QStringLiteral("Portal")));
    }
};

QTEST_MAIN(TestSearchHistory)
#include "test_search_history.moc"
