#include <QTest>
#include <QJsonDocument>
#include "adapters/inbound/messages_codec.h"

namespace {

QJsonObject parseObject(const QByteArray& json)
{
    return QJsonDocument::fromJson(json).object();
}

// Splits "event: X\ndata: {...}\n\n" into its name and payload.
QPair<QString, QJsonObject> parseFrame(const QByteArray& frame)
{
    const QList<QByteArray> lines = frame.trimmed().split('\n');
    return {QString::fromUtf8(lines.value(0).mid(7)), parseObject(lines.value(1).mid(6))};
}

}

class TestMessagesCodec : public QObject {
    Q_OBJECT

private slots:
    void testDecodeFullRequest() {
        const QByteArray body = R"({
            "model": "claude-sonnet-4-5-20250115",
            "system": [{"type": "text", "text": "Be brief."}],
            "max_tokens": 1024,
            "temperature": 0.5,
            "stop_sequences": ["STOP"],
            "stream": true,
            "metadata": {"user_id": "u-42"},
            "thinking": {"type": "enabled", "budget_tokens": 2048},
            "tools": [{"name": "get_weather", "description": "Weather",
                       "input_schema": {"type": "object"}}],
            "tool_choice": {"type": "tool", "name": "get_weather"},
            "messages": [
                {"role": "user", "content": "Hello"},
                {"role": "assistant", "content": [
                    {"type": "text", "text": "Checking"},
                    {"type": "tool_use", "id": "toolu_1", "name": "get_weather",
                     "input": {"city": "Oslo"}}]},
                {"role": "user", "content": [
                    {"type": "tool_result", "tool_use_id": "toolu_1",
                     "content": [{"type": "text", "text": "cold"}], "is_error": false},
                    {"type": "image", "source": {"type": "base64",
                     "media_type": "image/jpeg", "data": "QUJD"}}]}
            ]
        })";

        auto req = MessagesCodec::decodeRequest(body);
        QVERIFY(req.has_value());
        QCOMPARE(req->model, QStringLiteral("claude-sonnet-4-5-20250115"));
        QCOMPARE(req->system, QStringList{QStringLiteral("Be brief.")});
        QCOMPARE(req->maxTokens, 1024);
        QCOMPARE(*req->temperature, 0.5);
        QVERIFY(!req->topP.has_value());
        QCOMPARE(req->stopSequences, QStringList{QStringLiteral("STOP")});
        QVERIFY(req->stream);
        QCOMPARE(req->userId, QStringLiteral("u-42"));
        QVERIFY(req->thinkingRequested);
        QCOMPARE(req->thinkingBudget, 2048);

        QCOMPARE(req->tools.size(), 1);
        QCOMPARE(req->tools[0].inputSchema.value(QStringLiteral("type")).toString(),
                 QStringLiteral("object"));
        QVERIFY(std::holds_alternative<ToolChoiceTool>(*req->toolChoice));
        QCOMPARE(std::get<ToolChoiceTool>(*req->toolChoice).name, QStringLiteral("get_weather"));

        QCOMPARE(req->messages.size(), 3);
        QCOMPARE(std::get<TextBlock>(req->messages[0].content[0]).text, QStringLiteral("Hello"));
        const auto& toolUse = std::get<ToolUseBlock>(req->messages[1].content[1]);
        QCOMPARE(toolUse.input.value(QStringLiteral("city")).toString(), QStringLiteral("Oslo"));
        const auto& result = std::get<ToolResultBlock>(req->messages[2].content[0]);
        QCOMPARE(result.toolUseId, QStringLiteral("toolu_1"));
        QCOMPARE(result.content, QStringLiteral("cold"));
        const auto& image = std::get<ImageBlock>(req->messages[2].content[1]);
        QCOMPARE(image.mediaType, QStringLiteral("image/jpeg"));
        QCOMPARE(image.data, QStringLiteral("QUJD"));
    }

    void testDecodeStringSystem() {
        auto req = MessagesCodec::decodeRequest(
            R"({"model":"m","system":"Rules","messages":[{"role":"user","content":"x"}]})");
        QVERIFY(req.has_value());
        QCOMPARE(req->system, QStringList{QStringLiteral("Rules")});
        QVERIFY(!req->stream);
        QVERIFY(!req->thinkingRequested);
        QVERIFY(!req->toolChoice.has_value());
    }

    void testDecodeErrors_data() {
        QTest::addColumn<QByteArray>("body");
        QTest::addColumn<QString>("code");
        QTest::addColumn<QString>("messagePrefix");

        QTest::newRow("not json") << QByteArray("{oops")
            << QStringLiteral("invalid_json") << QStringLiteral("Request body");
        QTest::newRow("no model") << QByteArray(R"({"messages":[]})")
            << QStringLiteral("translation.invalid_input") << QStringLiteral("model:");
        QTest::newRow("messages not array") << QByteArray(R"({"model":"m","messages":{}})")
            << QStringLiteral("translation.invalid_input") << QStringLiteral("messages:");
        QTest::newRow("missing content")
            << QByteArray(R"({"model":"m","messages":[{"role":"user"}]})")
            << QStringLiteral("translation.invalid_input") << QStringLiteral("messages[0].content:");
        QTest::newRow("unknown block")
            << QByteArray(R"({"model":"m","messages":[{"role":"user","content":[{"type":"video"}]}]})")
            << QStringLiteral("translation.invalid_input")
            << QStringLiteral("messages[0].content[0].type:");
        QTest::newRow("bad tool choice")
            << QByteArray(R"({"model":"m","messages":[],"tool_choice":{"type":"sometimes"}})")
            << QStringLiteral("translation.unsupported_tool_choice") << QStringLiteral("tool_choice:");
        QTest::newRow("tool choice without name")
            << QByteArray(R"({"model":"m","messages":[],"tool_choice":{"type":"tool"}})")
            << QStringLiteral("translation.invalid_input") << QStringLiteral("tool_choice.name:");
    }

    void testDecodeErrors() {
        QFETCH(QByteArray, body);
        QFETCH(QString, code);
        QFETCH(QString, messagePrefix);

        auto req = MessagesCodec::decodeRequest(body);
        QVERIFY(!req.has_value());
        QCOMPARE(req.error().kind, ErrorKind::InvalidInput);
        QCOMPARE(req.error().code, code);
        QVERIFY2(req.error().message.startsWith(messagePrefix), qPrintable(req.error().message));
    }

    void testEncodeResponse() {
        MessagesResponse response;
        response.id = QStringLiteral("msg_1");
        response.model = QStringLiteral("claude-sonnet-4-5");
        response.content.append(ThinkingBlock{QStringLiteral("hmm"), QString()});
        response.content.append(TextBlock{QStringLiteral("Hi")});
        response.stopReason = StopReason::Other;
        response.usage.inputTokens = 5;
        response.usage.outputTokens = 2;

        const QJsonObject obj = parseObject(MessagesCodec::encodeResponse(response));
        QCOMPARE(obj.value(QStringLiteral("type")).toString(), QStringLiteral("message"));
        QCOMPARE(obj.value(QStringLiteral("role")).toString(), QStringLiteral("assistant"));
        QCOMPARE(obj.value(QStringLiteral("model")).toString(), QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(obj.value(QStringLiteral("stop_reason")).toString(), QStringLiteral("end_turn"));
        QVERIFY(obj.value(QStringLiteral("stop_sequence")).isNull());

        const QJsonArray content = obj.value(QStringLiteral("content")).toArray();
        QCOMPARE(content.size(), 2);
        QCOMPARE(content[0].toObject().value(QStringLiteral("type")).toString(), QStringLiteral("thinking"));
        QCOMPARE(content[1].toObject().value(QStringLiteral("text")).toString(), QStringLiteral("Hi"));

        const QJsonObject usage = obj.value(QStringLiteral("usage")).toObject();
        QCOMPARE(usage.value(QStringLiteral("input_tokens")).toInt(), 5);
        QVERIFY(!usage.contains(QStringLiteral("cache_read_input_tokens")));
    }

    void testEncodeEvents() {
        auto start = parseFrame(MessagesCodec::encodeEvent(
            MessageStartEvent{QStringLiteral("msg_9"), QStringLiteral("m"), Usage{}}));
        QCOMPARE(start.first, QStringLiteral("message_start"));
        QCOMPARE(start.second.value(QStringLiteral("type")).toString(), QStringLiteral("message_start"));
        QCOMPARE(start.second.value(QStringLiteral("message")).toObject()
                     .value(QStringLiteral("id")).toString(), QStringLiteral("msg_9"));

        auto toolStart = parseFrame(MessagesCodec::encodeEvent(ContentBlockStartEvent{
            1, BlockKind::ToolUse, QStringLiteral("toolu_1"), QStringLiteral("ls")}));
        const QJsonObject block = toolStart.second.value(QStringLiteral("content_block")).toObject();
        QCOMPARE(toolStart.second.value(QStringLiteral("index")).toInt(), 1);
        QCOMPARE(block.value(QStringLiteral("type")).toString(), QStringLiteral("tool_use"));
        QCOMPARE(block.value(QStringLiteral("name")).toString(), QStringLiteral("ls"));
        QVERIFY(block.value(QStringLiteral("input")).isObject());

        auto argDelta = parseFrame(MessagesCodec::encodeEvent(
            ContentBlockDeltaEvent{1, BlockKind::ToolUse, QStringLiteral("{\"a\":")}));
        const QJsonObject delta = argDelta.second.value(QStringLiteral("delta")).toObject();
        QCOMPARE(delta.value(QStringLiteral("type")).toString(), QStringLiteral("input_json_delta"));
        QCOMPARE(delta.value(QStringLiteral("partial_json")).toString(), QStringLiteral("{\"a\":"));

        auto thinkingDelta = parseFrame(MessagesCodec::encodeEvent(
            ContentBlockDeltaEvent{0, BlockKind::Thinking, QStringLiteral("so")}));
        QCOMPARE(thinkingDelta.second.value(QStringLiteral("delta")).toObject()
                     .value(QStringLiteral("type")).toString(), QStringLiteral("thinking_delta"));

        Usage usage;
        usage.outputTokens = 9;
        auto messageDelta = parseFrame(MessagesCodec::encodeEvent(
            MessageDeltaEvent{StopReason::ToolUse, usage}));
        QCOMPARE(messageDelta.second.value(QStringLiteral("delta")).toObject()
                     .value(QStringLiteral("stop_reason")).toString(), QStringLiteral("tool_use"));
        QCOMPARE(messageDelta.second.value(QStringLiteral("usage")).toObject()
                     .value(QStringLiteral("output_tokens")).toInt(), 9);

        const QByteArray stop = MessagesCodec::encodeEvent(MessageStopEvent{});
        QCOMPARE(stop, QByteArray("event: message_stop\ndata: {\"type\":\"message_stop\"}\n\n"));

        auto error = parseFrame(MessagesCodec::encodeEvent(
            ErrorEvent{QStringLiteral("api_error"), QStringLiteral("boom")}));
        QCOMPARE(error.first, QStringLiteral("error"));
        QCOMPARE(error.second.value(QStringLiteral("error")).toObject()
                     .value(QStringLiteral("message")).toString(), QStringLiteral("boom"));
    }

    void testEncodeFailure() {
        const QJsonObject obj = parseObject(MessagesCodec::encodeFailure(DomainFailure::missingToken()));
        QCOMPARE(obj.value(QStringLiteral("type")).toString(), QStringLiteral("error"));
        QCOMPARE(obj.value(QStringLiteral("error")).toObject().value(QStringLiteral("type")).toString(),
                 QStringLiteral("authentication_error"));
    }

    void testEncodeModelList() {
        ModelList models;
        models.append(ModelInfo{QStringLiteral("claude-sonnet-4.5"), QStringLiteral("claude-sonnet-4-5"),
                                QStringLiteral("Claude Sonnet 4.5"), QStringLiteral("Anthropic"), 0});
        models.append(ModelInfo{QStringLiteral("gpt-4o"), QStringLiteral("gpt-4o"),
                                QString(), QString(), 1700000000});

        const QJsonObject obj = parseObject(MessagesCodec::encodeModelList(models));
        const QJsonArray data = obj.value(QStringLiteral("data")).toArray();
        QCOMPARE(data.size(), 2);
        QCOMPARE(data[0].toObject().value(QStringLiteral("id")).toString(), QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(data[0].toObject().value(QStringLiteral("display_name")).toString(),
                 QStringLiteral("Claude Sonnet 4.5"));
        QCOMPARE(data[1].toObject().value(QStringLiteral("display_name")).toString(), QStringLiteral("gpt-4o"));
        QVERIFY(data[1].toObject().contains(QStringLiteral("created_at")));
        QCOMPARE(obj.value(QStringLiteral("first_id")).toString(), QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(obj.value(QStringLiteral("last_id")).toString(), QStringLiteral("gpt-4o"));
        QVERIFY(!obj.value(QStringLiteral("has_more")).toBool());
    }
};

QTEST_MAIN(TestMessagesCodec)
#include "tst_messages_codec.moc"
