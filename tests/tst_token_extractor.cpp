#include <QTest>
#include "auth/token_extractor.h"

class TestTokenExtractor : public QObject {
    Q_OBJECT

private slots:
    void testHeaderPrecedence() {
        QMap<QString, QString> headers;
        headers[QStringLiteral("authorization")] = QStringLiteral("Bearer gho_fromBearer");
        headers[QStringLiteral("api-key")] = QStringLiteral("ghu_fromApiKey");
        QCOMPARE(TokenExtractor::extract(headers), QStringLiteral("gho_fromBearer"));

        headers[QStringLiteral("x-api-key")] = QStringLiteral("ghp_fromXApiKey");
        QCOMPARE(TokenExtractor::extract(headers), QStringLiteral("ghp_fromXApiKey"));
    }

    void testNonGithubValuesSkipped() {
        QMap<QString, QString> headers;
        headers[QStringLiteral("x-api-key")] = QStringLiteral("sk-ant-placeholder");
        headers[QStringLiteral("authorization")] = QStringLiteral("bearer  github_pat_11ABC ");
        QCOMPARE(TokenExtractor::extract(headers), QStringLiteral("github_pat_11ABC"));
    }

    void testNothingUsable() {
        QMap<QString, QString> headers;
        QVERIFY(TokenExtractor::extract(headers).isEmpty());

        headers[QStringLiteral("authorization")] = QStringLiteral("Basic ghp_abc");
        headers[QStringLiteral("x-api-key")] = QStringLiteral("dummy");
        QVERIFY(TokenExtractor::extract(headers).isEmpty());
    }

    void testLooksLikeGithubToken_data() {
        QTest::addColumn<QString>("token");
        QTest::addColumn<bool>("expected");
        QTest::newRow("classic") << QStringLiteral("ghp_abc123") << true;
        QTest::newRow("oauth") << QStringLiteral("gho_abc") << true;
        QTest::newRow("user-to-server") << QStringLiteral("ghu_abc") << true;
        QTest::newRow("fine-grained") << QStringLiteral("github_pat_abc") << true;
        QTest::newRow("prefix only") << QStringLiteral("ghp_") << false;
        QTest::newRow("server-to-server") << QStringLiteral("ghs_abc") << false;
        QTest::newRow("empty") << QString() << false;
    }

    void testLooksLikeGithubToken() {
        QFETCH(QString, token);
        QFETCH(bool, expected);
        QCOMPARE(TokenExtractor::looksLikeGithubToken(token), expected);
    }
};

QTEST_MAIN(TestTokenExtractor)
#include "tst_token_extractor.moc"
