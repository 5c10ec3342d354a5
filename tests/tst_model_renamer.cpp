#include <QTest>
#include "naming/model_renamer.h"

class TestModelRenamer : public QObject {
    Q_OBJECT

private slots:
    void testStripDateSuffix() {
        QCOMPARE(ModelRenamer::stripDateSuffix(QStringLiteral("claude-sonnet-4-5-20250115")),
                 QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(ModelRenamer::stripDateSuffix(QStringLiteral("gpt-4o-2024-11-20")),
                 QStringLiteral("gpt-4o"));
        QCOMPARE(ModelRenamer::stripDateSuffix(QStringLiteral("gpt-4o")),
                 QStringLiteral("gpt-4o"));
        // Short numeric tails are not dates.
        QCOMPARE(ModelRenamer::stripDateSuffix(QStringLiteral("o3-1234")),
                 QStringLiteral("o3-1234"));
    }

    void testDatedIdMapsToBareClientId() {
        ModelRenamer renamer;
        QCOMPARE(renamer.toClient(QStringLiteral("claude-sonnet-4-5-20250115")),
                 QStringLiteral("claude-sonnet-4-5"));
    }

    void testPatternRules() {
        ModelRenamer renamer;
        QCOMPARE(renamer.toClient(QStringLiteral("claude-sonnet-4.5")),
                 QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(renamer.toClient(QStringLiteral("claude-3.5-sonnet")),
                 QStringLiteral("claude-sonnet-3-5"));
        QCOMPARE(renamer.toClient(QStringLiteral("claude-3.7-sonnet-thought")),
                 QStringLiteral("claude-sonnet-thought-3-7"));
        QCOMPARE(renamer.toClient(QStringLiteral("gpt-4.1")), QStringLiteral("gpt-4.1"));
    }

    void testPatternRulesDisabled() {
        ModelRenamer renamer({}, false);
        QCOMPARE(renamer.toClient(QStringLiteral("claude-sonnet-4.5")),
                 QStringLiteral("claude-sonnet-4.5"));
        // Date stripping still applies.
        QCOMPARE(renamer.toClient(QStringLiteral("claude-sonnet-4.5-20250101")),
                 QStringLiteral("claude-sonnet-4.5"));
    }

    void testOverrideWins() {
        QHash<QString, QString> overrides;
        overrides.insert(QStringLiteral("claude-sonnet-4.5"), QStringLiteral("sonnet"));
        ModelRenamer renamer(overrides);

        QCOMPARE(renamer.toClient(QStringLiteral("claude-sonnet-4.5")), QStringLiteral("sonnet"));
        QCOMPARE(renamer.toClient(QStringLiteral("claude-sonnet-4.5-20250101")), QStringLiteral("sonnet"));
        QCOMPARE(renamer.toBackend(QStringLiteral("sonnet")), QStringLiteral("claude-sonnet-4.5"));
    }

    void testOverridesApplyWithPatternsDisabled() {
        QHash<QString, QString> overrides;
        overrides.insert(QStringLiteral("gpt-4o"), QStringLiteral("omni"));
        ModelRenamer renamer(overrides, false);
        QCOMPARE(renamer.toClient(QStringLiteral("gpt-4o")), QStringLiteral("omni"));
    }

    void testLearnedReverseMapping() {
        ModelRenamer renamer;
        QCOMPARE(renamer.learn(QStringLiteral("claude-sonnet-4.5")),
                 QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(renamer.toBackend(QStringLiteral("claude-sonnet-4-5")),
                 QStringLiteral("claude-sonnet-4.5"));
        // A dated client id resolves through its base.
        QCOMPARE(renamer.toBackend(QStringLiteral("claude-sonnet-4-5-20250115")),
                 QStringLiteral("claude-sonnet-4.5"));
        QCOMPARE(renamer.learnedCount(), 1);

        renamer.clearLearned();
        QCOMPARE(renamer.toBackend(QStringLiteral("claude-sonnet-4-5")),
                 QStringLiteral("claude-sonnet-4-5"));
    }

    void testCanonicalRepresentative() {
        ModelRenamer renamer;
        renamer.learn(QStringLiteral("claude-sonnet-4.5-20250101"));
        renamer.learn(QStringLiteral("claude-sonnet-4.5"));
        QCOMPARE(renamer.toBackend(QStringLiteral("claude-sonnet-4-5")),
                 QStringLiteral("claude-sonnet-4.5-20250101"));

        // An exact backend match becomes the representative.
        renamer.learn(QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(renamer.toBackend(QStringLiteral("claude-sonnet-4-5")),
                 QStringLiteral("claude-sonnet-4-5"));
    }

    void testRoundTripStability_data() {
        QTest::addColumn<QString>("backendId");
        QTest::newRow("dotted") << QStringLiteral("claude-sonnet-4.5");
        QTest::newRow("version-first") << QStringLiteral("claude-3.5-sonnet");
        QTest::newRow("dated") << QStringLiteral("claude-opus-4-20250514");
        QTest::newRow("other-vendor") << QStringLiteral("gpt-4o");
        QTest::newRow("override") << QStringLiteral("o3-mini");
    }

    void testRoundTripStability() {
        QFETCH(QString, backendId);
        QHash<QString, QString> overrides;
        overrides.insert(QStringLiteral("o3-mini"), QStringLiteral("reasoner"));
        ModelRenamer renamer(overrides);
        renamer.learn(backendId);

        const QString client = renamer.toClient(backendId);
        QCOMPARE(renamer.toClient(renamer.toBackend(client)), client);
    }

    void testUnknownIdPassesThrough() {
        ModelRenamer renamer;
        QCOMPARE(renamer.toClient(QStringLiteral("mistral-large")), QStringLiteral("mistral-large"));
        QCOMPARE(renamer.toBackend(QStringLiteral("mistral-large")), QStringLiteral("mistral-large"));
    }
};

QTEST_MAIN(TestModelRenamer)
#include "tst_model_renamer.moc"
