#include <QTest>
#include <QSignalSpy>
#include "core/log_manager.h"

class TestLogManager : public QObject {
    Q_OBJECT

private slots:
    void init() {
        LogManager::instance().setMinimumLevel(LogManager::Debug);
        LogManager::instance().clearLogs();
    }

    void cleanup() {
        LogManager::instance().setMinimumLevel(LogManager::Info);
    }

    void testEntriesAreBufferedAndSignalled() {
        LogManager& logger = LogManager::instance();
        QSignalSpy spy(&logger, &LogManager::logEntry);

        LOG_INFO(QStringLiteral("first"));
        logger.log(LogManager::Warning, QStringLiteral("proxy"), QStringLiteral("second"));

        QCOMPARE(spy.count(), 2);
        QCOMPARE(spy.at(1).at(0).toInt(), static_cast<int>(LogManager::Warning));
        QCOMPARE(spy.at(1).at(2).toString(), QStringLiteral("proxy"));
        QCOMPARE(spy.at(1).at(3).toString(), QStringLiteral("second"));

        const QVariantList entries = logger.recentLogs();
        QCOMPARE(entries.size(), 2);
        const QVariantMap first = entries.at(0).toMap();
        QCOMPARE(first.value(QStringLiteral("level")).toInt(), static_cast<int>(LogManager::Info));
        QCOMPARE(first.value(QStringLiteral("category")).toString(), QStringLiteral("app"));
        QCOMPARE(first.value(QStringLiteral("message")).toString(), QStringLiteral("first"));
        QVERIFY(!first.value(QStringLiteral("timestamp")).toString().isEmpty());

        const QVariantList last = logger.recentLogs(1);
        QCOMPARE(last.size(), 1);
        QCOMPARE(last.at(0).toMap().value(QStringLiteral("message")).toString(), QStringLiteral("second"));
    }

    void testFilteredEntriesAreNotBuffered() {
        LogManager& logger = LogManager::instance();
        logger.setMinimumLevel(LogManager::Warning);
        QSignalSpy spy(&logger, &LogManager::logEntry);

        LOG_DEBUG(QStringLiteral("quiet"));
        LOG_INFO(QStringLiteral("quiet"));
        LOG_ERROR(QStringLiteral("loud"));

        QCOMPARE(spy.count(), 1);
        QCOMPARE(logger.recentLogs().size(), 1);
    }

    void testBufferIsBounded() {
        LogManager& logger = LogManager::instance();
        const int total = logger.maxBuffer() + 25;
        for (int i = 0; i < total; ++i)
            LOG_DEBUG(QStringLiteral("entry %1").arg(i));

        const QVariantList entries = logger.recentLogs(total);
        QCOMPARE(entries.size(), logger.maxBuffer());
        QCOMPARE(entries.first().toMap().value(QStringLiteral("message")).toString(),
                 QStringLiteral("entry 25"));
        QCOMPARE(entries.last().toMap().value(QStringLiteral("message")).toString(),
                 QStringLiteral("entry %1").arg(total - 1));

        logger.clearLogs();
        QVERIFY(logger.recentLogs().isEmpty());
    }

    void testFormatMessage() {
        const QString line = LogManager::formatMessage(LogManager::Warning, QStringLiteral("auth"),
                                                       QStringLiteral("token refreshed"));
        QVERIFY(line.contains(QStringLiteral("[WARN] [auth] token refreshed")));
    }
};

QTEST_MAIN(TestLogManager)
#include "tst_log_manager.moc"
