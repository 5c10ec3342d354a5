#include <QTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>
#include "config/config_store.h"
#include "config/config_types.h"
#include "core/log_manager.h"

class TestConfigStore : public QObject {
    Q_OBJECT

private slots:
    void testDefaults() {
        ConfigStore store;
        const AppConfig& config = store.config();
        QCOMPARE(config.port, 4141);
        QCOMPARE(config.accountType, QStringLiteral("individual"));
        QVERIFY(config.githubToken.isEmpty());
        QVERIFY(config.emulateThinking);
        QVERIFY(config.modelRenameAuto);
        QCOMPARE(config.modelsCacheTtl, 300);
        QCOMPARE(config.tokenRefreshMargin, 60);
        QCOMPARE(config.maxBodyBytes, 32 * 1024 * 1024);
    }

    void testLoadMissingFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        ConfigStore store;
        QVERIFY(!store.load(dir.path() + QStringLiteral("/absent.json")));
        QCOMPARE(store.config().port, 4141);
    }

    void testLoadFileWithBothKeyStyles() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.path() + QStringLiteral("/msgbridge.json");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(R"({
            "port": 8080,
            "accountType": "business",
            "gh_token": "ghp_file",
            "model_rename_map": {"gpt-4o": "my-model", "bad": 3},
            "emulateThinking": false,
            "models_cache_ttl": 0,
            "requestTimeout": 5
        })");
        file.close();

        ConfigStore store;
        QSignalSpy changed(&store, &ConfigStore::configChanged);
        QVERIFY(store.load(path));
        QCOMPARE(changed.count(), 1);
        QCOMPARE(store.filePath(), path);

        const AppConfig& config = store.config();
        QCOMPARE(config.port, 8080);
        QCOMPARE(config.accountType, QStringLiteral("business"));
        QCOMPARE(config.githubToken, QStringLiteral("ghp_file"));
        QCOMPARE(config.modelRenameMap.size(), 1);
        QCOMPARE(config.modelRenameMap.value(QStringLiteral("gpt-4o")), QStringLiteral("my-model"));
        QVERIFY(!config.emulateThinking);
        QCOMPARE(config.modelsCacheTtl, 0);
        QCOMPARE(config.requestTimeout, 1000);
    }

    void testInvalidJsonKeepsConfig() {
        ConfigStore store;
        QVERIFY(!store.loadFromJson("[1,2"));
        QVERIFY(!store.loadFromJson("[]"));
        QCOMPARE(store.config().port, 4141);
    }

    void testEnvironmentOverridesFile() {
        ConfigStore store;
        QVERIFY(store.loadFromJson(R"({"port": 9000, "log_level": "warning"})"));

        QProcessEnvironment env;
        env.insert(QStringLiteral("PORT"), QStringLiteral("4200"));
        env.insert(QStringLiteral("LOG_LEVEL"), QStringLiteral("DEBUG"));
        env.insert(QStringLiteral("GH_TOKEN"), QStringLiteral(" ghp_env "));
        env.insert(QStringLiteral("ACCOUNT_TYPE"), QStringLiteral("Enterprise"));
        env.insert(QStringLiteral("MODEL_RENAME_MAP"), QStringLiteral(R"({"a":"b"})"));
        env.insert(QStringLiteral("MODEL_RENAME_AUTO"), QStringLiteral("off"));
        env.insert(QStringLiteral("EMULATE_THINKING"), QStringLiteral("no"));
        env.insert(QStringLiteral("MODELS_CACHE_TTL"), QStringLiteral("60"));
        env.insert(QStringLiteral("TOKEN_REFRESH_MARGIN"), QStringLiteral("90"));
        env.insert(QStringLiteral("MAX_BODY_BYTES"), QStringLiteral("65536"));
        store.applyEnvironment(env);

        const AppConfig& config = store.config();
        QCOMPARE(config.port, 4200);
        QCOMPARE(config.logLevel, QStringLiteral("debug"));
        QCOMPARE(config.githubToken, QStringLiteral("ghp_env"));
        QCOMPARE(config.accountType, QStringLiteral("enterprise"));
        QCOMPARE(config.modelRenameMap.value(QStringLiteral("a")), QStringLiteral("b"));
        QVERIFY(!config.modelRenameAuto);
        QVERIFY(!config.emulateThinking);
        QCOMPARE(config.modelsCacheTtl, 60);
        QCOMPARE(config.tokenRefreshMargin, 90);
        QCOMPARE(config.maxBodyBytes, 65536);
    }

    void testInvalidEnvironmentValuesIgnored() {
        ConfigStore store;
        QProcessEnvironment env;
        env.insert(QStringLiteral("PORT"), QStringLiteral("70000"));
        env.insert(QStringLiteral("MODELS_CACHE_TTL"), QStringLiteral("soon"));
        env.insert(QStringLiteral("EMULATE_THINKING"), QStringLiteral("maybe"));
        env.insert(QStringLiteral("MODEL_RENAME_MAP"), QStringLiteral("not json"));
        env.insert(QStringLiteral("ACCOUNT_TYPE"), QStringLiteral("  "));
        env.insert(QStringLiteral("REQUEST_TIMEOUT"), QStringLiteral("10"));
        store.applyEnvironment(env);

        const AppConfig& config = store.config();
        QCOMPARE(config.port, 4141);
        QCOMPARE(config.modelsCacheTtl, 300);
        QVERIFY(config.emulateThinking);
        QVERIFY(config.modelRenameMap.isEmpty());
        QCOMPARE(config.accountType, QStringLiteral("individual"));
        QCOMPARE(config.requestTimeout, 120000);
    }

    void testParseBool_data() {
        QTest::addColumn<QString>("input");
        QTest::addColumn<bool>("valid");
        QTest::addColumn<bool>("expected");
        QTest::newRow("1") << QStringLiteral("1") << true << true;
        QTest::newRow("TRUE") << QStringLiteral("TRUE") << true << true;
        QTest::newRow("yes") << QStringLiteral(" yes ") << true << true;
        QTest::newRow("on") << QStringLiteral("on") << true << true;
        QTest::newRow("0") << QStringLiteral("0") << true << false;
        QTest::newRow("False") << QStringLiteral("False") << true << false;
        QTest::newRow("off") << QStringLiteral("off") << true << false;
        QTest::newRow("garbage") << QStringLiteral("2") << false << false;
        QTest::newRow("empty") << QString() << false << false;
    }

    void testParseBool() {
        QFETCH(QString, input);
        QFETCH(bool, valid);
        QFETCH(bool, expected);
        bool ok = !valid;
        QCOMPARE(ConfigStore::parseBool(input, &ok), expected);
        QCOMPARE(ok, valid);
    }

    void testLogLevelNames() {
        QCOMPARE(LogManager::parseLevel(QStringLiteral("DEBUG")), LogManager::Debug);
        QCOMPARE(LogManager::parseLevel(QStringLiteral("trace")), LogManager::Debug);
        QCOMPARE(LogManager::parseLevel(QStringLiteral(" warn ")), LogManager::Warning);
        QCOMPARE(LogManager::parseLevel(QStringLiteral("error")), LogManager::Error);
        QCOMPARE(LogManager::parseLevel(QStringLiteral("loud")), LogManager::Info);
        QCOMPARE(LogManager::parseLevel(QStringLiteral("loud"), LogManager::Error), LogManager::Error);
    }
};

QTEST_MAIN(TestConfigStore)
#include "tst_config_store.moc"
