#include <QTest>
#include <QJsonDocument>
#include "adapters/outbound/copilot_api.h"

class TestCopilotApi : public QObject {
    Q_OBJECT

private slots:
    void testBaseUrl() {
        QCOMPARE(CopilotApi().baseUrl(), QStringLiteral("https://api.githubcopilot.com"));
        QCOMPARE(CopilotApi(QStringLiteral("Business")).baseUrl(),
                 QStringLiteral("https://api.business.githubcopilot.com"));
        QCOMPARE(CopilotApi(QStringLiteral("enterprise")).baseUrl(),
                 QStringLiteral("https://api.enterprise.githubcopilot.com"));
        QCOMPARE(CopilotApi(QStringLiteral(" ")).accountType(), QStringLiteral("individual"));
    }

    void testBackendHeaders() {
        CopilotApi api(QStringLiteral("individual"), QStringLiteral("1.99.0"));
        const ProviderRequest models = api.modelsRequest(QStringLiteral("tid=x"));
        QCOMPARE(models.method, QStringLiteral("GET"));
        QCOMPARE(models.headers.value(QStringLiteral("Authorization")), QStringLiteral("Bearer tid=x"));
        QCOMPARE(models.headers.value(QStringLiteral("editor-version")), QStringLiteral("vscode/1.99.0"));
        QCOMPARE(models.headers.value(QStringLiteral("copilot-integration-id")), QStringLiteral("vscode-chat"));
        QVERIFY(!models.headers.value(QStringLiteral("x-request-id")).isEmpty());
        QVERIFY(!models.headers.contains(QStringLiteral("copilot-vision-request")));

        ChatRequest chat;
        chat.model = QStringLiteral("gpt-4o");
        ChatMessage user;
        user.role = QStringLiteral("user");
        user.parts.append(ChatContentPart{ChatContentPart::Kind::ImageUrl, QString(), QStringLiteral("data:x")});
        chat.messages.append(user);
        const ProviderRequest req = api.chatCompletionsRequest(chat, QStringLiteral("tid=x"));
        QCOMPARE(req.method, QStringLiteral("POST"));
        QCOMPARE(req.headers.value(QStringLiteral("copilot-vision-request")), QStringLiteral("true"));
        QCOMPARE(req.headers.value(QStringLiteral("x-initiator")), QStringLiteral("user"));
        QVERIFY(!req.stream);
        QCOMPARE(QJsonDocument::fromJson(req.body).object().value(QStringLiteral("model")).toString(),
                 QStringLiteral("gpt-4o"));
    }

    void testParseTokenResponse_data() {
        QTest::addColumn<QByteArray>("body");
        QTest::addColumn<bool>("valid");
        QTest::addColumn<int>("expiresInSecs");

        QTest::newRow("expires_in") << QByteArray(R"({"token":"t","expires_in":1500})") << true << 1500;
        QTest::newRow("expires_in wins") << QByteArray(R"({"token":"t","expires_in":600,"expires_at":1760009999})")
                                         << true << 600;
        QTest::newRow("expires_at") << QByteArray(R"({"token":"t","expires_at":1760001800})") << true << 1800;
        QTest::newRow("refresh_in") << QByteArray(R"({"token":"t","refresh_in":1500})") << true << 1560;
        QTest::newRow("no token") << QByteArray(R"({"expires_in":1500})") << false << 0;
        QTest::newRow("no expiry") << QByteArray(R"({"token":"t"})") << false << 0;
        QTest::newRow("already expired") << QByteArray(R"({"token":"t","expires_at":1759999000})") << false << 0;
        QTest::newRow("not json") << QByteArray("<html>") << false << 0;
    }

    void testParseTokenResponse() {
        QFETCH(QByteArray, body);
        QFETCH(bool, valid);
        QFETCH(int, expiresInSecs);

        const QDateTime now = QDateTime::fromSecsSinceEpoch(1760000000, Qt::UTC);
        auto credential = CopilotApi::parseTokenResponse(body, now);
        QCOMPARE(credential.has_value(), valid);
        if (valid) {
            QCOMPARE(credential->token, QStringLiteral("t"));
            QCOMPARE(now.secsTo(credential->expiresAt), qint64(expiresInSecs));
        } else {
            QCOMPARE(credential.error().code, QStringLiteral("auth.exchange_failed"));
        }
    }
};

QTEST_MAIN(TestCopilotApi)
#include "tst_copilot_api.moc"
