#include "adapters/inbound/messages_codec.h"
#include "core/log_manager.h"
#include <QDateTime>
#include <QJsonDocument>

namespace {

const QString kInvalidInput = QStringLiteral("translation.invalid_input");

DomainFailure invalidField(const QString& field, const QString& problem)
{
    return DomainFailure::invalidInput(kInvalidInput, field + QStringLiteral(": ") + problem);
}

QByteArray sseFrame(const QString& name, const QJsonObject& payload)
{
    return QByteArray("event: ") + name.toUtf8() + QByteArray("\ndata: ")
        + QJsonDocument(payload).toJson(QJsonDocument::Compact)
        + QByteArray("\n\n");
}

QString blockKindName(BlockKind kind)
{
    switch (kind) {
    case BlockKind::Text:     return QStringLiteral("text");
    case BlockKind::ToolUse:  return QStringLiteral("tool_use");
    case BlockKind::Thinking: return QStringLiteral("thinking");
    }
    return QStringLiteral("text");
}

}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

Result<MessagesRequest> MessagesCodec::decodeRequest(const QByteArray& body)
{
    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_json"),
            QStringLiteral("Request body is not valid JSON: %1").arg(parseErr.errorString())));
    }

    const QJsonObject root = doc.object();
    MessagesRequest req;

    const QJsonValue model = root.value(QStringLiteral("model"));
    if (!model.isString() || model.toString().isEmpty())
        return std::unexpected(invalidField(QStringLiteral("model"), QStringLiteral("field is required")));
    req.model = model.toString();

    if (root.contains(QStringLiteral("system"))) {
        auto system = decodeSystem(root.value(QStringLiteral("system")));
        if (!system)
            return std::unexpected(system.error());
        req.system = *system;
    }

    const QJsonValue messages = root.value(QStringLiteral("messages"));
    if (!messages.isArray())
        return std::unexpected(invalidField(QStringLiteral("messages"), QStringLiteral("must be an array")));

    const QJsonArray messageArray = messages.toArray();
    for (int i = 0; i < messageArray.size(); ++i) {
        const QString field = QStringLiteral("messages[%1]").arg(i);
        if (!messageArray.at(i).isObject())
            return std::unexpected(invalidField(field, QStringLiteral("must be an object")));
        const QJsonObject msgObj = messageArray.at(i).toObject();

        ClientMessage message;
        message.role = msgObj.value(QStringLiteral("role")).toString();
        if (message.role.isEmpty())
            return std::unexpected(invalidField(field + QStringLiteral(".role"), QStringLiteral("field is required")));
        if (!msgObj.contains(QStringLiteral("content")))
            return std::unexpected(invalidField(field + QStringLiteral(".content"), QStringLiteral("field is required")));

        auto content = decodeContent(msgObj.value(QStringLiteral("content")),
                                     field + QStringLiteral(".content"));
        if (!content)
            return std::unexpected(content.error());
        message.content = *content;
        req.messages.append(message);
    }

    const QJsonArray tools = root.value(QStringLiteral("tools")).toArray();
    for (const QJsonValue& tv : tools) {
        const QJsonObject toolObj = tv.toObject();
        ToolDefinition tool;
        tool.name = toolObj.value(QStringLiteral("name")).toString();
        tool.description = toolObj.value(QStringLiteral("description")).toString();
        tool.inputSchema = toolObj.value(QStringLiteral("input_schema")).toObject();
        req.tools.append(tool);
    }

    if (root.contains(QStringLiteral("tool_choice")) && !root.value(QStringLiteral("tool_choice")).isNull()) {
        auto choice = decodeToolChoice(root.value(QStringLiteral("tool_choice")));
        if (!choice)
            return std::unexpected(choice.error());
        req.toolChoice = *choice;
    }

    req.maxTokens = root.value(QStringLiteral("max_tokens")).toInt(0);
    if (root.value(QStringLiteral("temperature")).isDouble())
        req.temperature = root.value(QStringLiteral("temperature")).toDouble();
    if (root.value(QStringLiteral("top_p")).isDouble())
        req.topP = root.value(QStringLiteral("top_p")).toDouble();

    const QJsonArray stops = root.value(QStringLiteral("stop_sequences")).toArray();
    for (const QJsonValue& sv : stops) {
        if (sv.isString())
            req.stopSequences.append(sv.toString());
    }

    req.stream = root.value(QStringLiteral("stream")).toBool(false);
    req.userId = root.value(QStringLiteral("metadata")).toObject()
                     .value(QStringLiteral("user_id")).toString();

    const QJsonObject thinking = root.value(QStringLiteral("thinking")).toObject();
    req.thinkingRequested = thinking.value(QStringLiteral("type")).toString() == QStringLiteral("enabled");
    req.thinkingBudget = thinking.value(QStringLiteral("budget_tokens")).toInt(0);

    return req;
}

Result<QStringList> MessagesCodec::decodeSystem(const QJsonValue& system)
{
    QStringList parts;
    if (system.isNull() || system.isUndefined())
        return parts;
    if (system.isString()) {
        if (!system.toString().isEmpty())
            parts.append(system.toString());
        return parts;
    }
    if (!system.isArray())
        return std::unexpected(invalidField(QStringLiteral("system"), QStringLiteral("must be a string or an array")));

    const QJsonArray blocks = system.toArray();
    for (int i = 0; i < blocks.size(); ++i) {
        const QJsonObject block = blocks.at(i).toObject();
        const QString type = block.value(QStringLiteral("type")).toString();
        if (type != QStringLiteral("text")) {
            return std::unexpected(invalidField(QStringLiteral("system[%1].type").arg(i),
                                                QStringLiteral("expected 'text', got '%1'").arg(type)));
        }
        parts.append(block.value(QStringLiteral("text")).toString());
    }
    return parts;
}

Result<QList<ContentBlock>> MessagesCodec::decodeContent(const QJsonValue& content,
                                                         const QString& field)
{
    QList<ContentBlock> blocks;
    if (content.isString()) {
        blocks.append(TextBlock{content.toString()});
        return blocks;
    }
    if (!content.isArray())
        return std::unexpected(invalidField(field, QStringLiteral("must be a string or an array")));

    const QJsonArray array = content.toArray();
    for (int j = 0; j < array.size(); ++j) {
        const QString blockField = field + QStringLiteral("[%1]").arg(j);
        if (!array.at(j).isObject())
            return std::unexpected(invalidField(blockField, QStringLiteral("must be an object")));
        auto block = decodeBlock(array.at(j).toObject(), blockField);
        if (!block)
            return std::unexpected(block.error());
        blocks.append(*block);
    }
    return blocks;
}

Result<ContentBlock> MessagesCodec::decodeBlock(const QJsonObject& block, const QString& field)
{
    const QString type = block.value(QStringLiteral("type")).toString();

    if (type == QStringLiteral("text"))
        return TextBlock{block.value(QStringLiteral("text")).toString()};

    if (type == QStringLiteral("image")) {
        const QJsonObject source = block.value(QStringLiteral("source")).toObject();
        const QString sourceType = source.value(QStringLiteral("type")).toString();
        ImageBlock image;
        if (sourceType == QStringLiteral("base64")) {
            image.mediaType = source.value(QStringLiteral("media_type")).toString();
            image.data = source.value(QStringLiteral("data")).toString();
        } else if (sourceType == QStringLiteral("url")) {
            image.url = source.value(QStringLiteral("url")).toString();
        } else {
            return std::unexpected(invalidField(field + QStringLiteral(".source.type"),
                                                QStringLiteral("unsupported image source '%1'").arg(sourceType)));
        }
        return image;
    }

    if (type == QStringLiteral("tool_use")) {
        ToolUseBlock toolUse;
        toolUse.id = block.value(QStringLiteral("id")).toString();
        toolUse.name = block.value(QStringLiteral("name")).toString();
        toolUse.input = block.value(QStringLiteral("input")).toObject();
        return toolUse;
    }

    if (type == QStringLiteral("tool_result")) {
        ToolResultBlock result;
        result.toolUseId = block.value(QStringLiteral("tool_use_id")).toString();
        result.content = flattenToolResultContent(block.value(QStringLiteral("content")));
        result.isError = block.value(QStringLiteral("is_error")).toBool(false);
        return result;
    }

    if (type == QStringLiteral("thinking")) {
        return ThinkingBlock{block.value(QStringLiteral("thinking")).toString(),
                             block.value(QStringLiteral("signature")).toString()};
    }

    if (type == QStringLiteral("redacted_thinking"))
        return ThinkingBlock{};

    return std::unexpected(invalidField(field + QStringLiteral(".type"),
                                        QStringLiteral("unknown content block type '%1'").arg(type)));
}

QString MessagesCodec::flattenToolResultContent(const QJsonValue& content)
{
    if (content.isString())
        return content.toString();

    QStringList texts;
    const QJsonArray blocks = content.toArray();
    for (const QJsonValue& bv : blocks) {
        const QJsonObject block = bv.toObject();
        if (block.value(QStringLiteral("type")).toString() == QStringLiteral("text")) {
            texts.append(block.value(QStringLiteral("text")).toString());
        } else {
            LOG_DEBUG(QStringLiteral("MessagesCodec: dropping non-text tool_result part '%1'")
                          .arg(block.value(QStringLiteral("type")).toString()));
        }
    }
    return texts.join(QStringLiteral("\n\n"));
}

Result<ToolChoice> MessagesCodec::decodeToolChoice(const QJsonValue& value)
{
    const QString type = value.isString()
        ? value.toString()
        : value.toObject().value(QStringLiteral("type")).toString();

    if (type == QStringLiteral("auto"))
        return ToolChoiceAuto{};
    if (type == QStringLiteral("any"))
        return ToolChoiceAny{};
    if (type == QStringLiteral("none"))
        return ToolChoiceNone{};
    if (type == QStringLiteral("tool")) {
        const QString name = value.toObject().value(QStringLiteral("name")).toString();
        if (name.isEmpty())
            return std::unexpected(invalidField(QStringLiteral("tool_choice.name"), QStringLiteral("field is required")));
        return ToolChoiceTool{name};
    }
    return std::unexpected(DomainFailure::unsupportedToolChoice(type));
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

QString MessagesCodec::stopReasonName(StopReason reason)
{
    switch (reason) {
    case StopReason::EndTurn:      return QStringLiteral("end_turn");
    case StopReason::MaxTokens:    return QStringLiteral("max_tokens");
    case StopReason::ToolUse:      return QStringLiteral("tool_use");
    case StopReason::StopSequence: return QStringLiteral("stop_sequence");
    case StopReason::Refusal:      return QStringLiteral("refusal");
    case StopReason::Other:        return QStringLiteral("end_turn");
    }
    return QStringLiteral("end_turn");
}

QJsonObject MessagesCodec::usageToJson(const Usage& usage)
{
    QJsonObject obj;
    obj[QStringLiteral("input_tokens")] = usage.inputTokens;
    obj[QStringLiteral("output_tokens")] = usage.outputTokens;
    if (usage.cacheReadInputTokens)
        obj[QStringLiteral("cache_read_input_tokens")] = *usage.cacheReadInputTokens;
    return obj;
}

QJsonObject MessagesCodec::blockToJson(const ContentBlock& block)
{
    return std::visit(Overloaded{
        [](const TextBlock& b) {
            QJsonObject obj;
            obj[QStringLiteral("type")] = QStringLiteral("text");
            obj[QStringLiteral("text")] = b.text;
            return obj;
        },
        [](const ImageBlock& b) {
            QJsonObject source;
            if (b.url.isEmpty()) {
                source[QStringLiteral("type")] = QStringLiteral("base64");
                source[QStringLiteral("media_type")] = b.mediaType;
                source[QStringLiteral("data")] = b.data;
            } else {
                source[QStringLiteral("type")] = QStringLiteral("url");
                source[QStringLiteral("url")] = b.url;
            }
            QJsonObject obj;
            obj[QStringLiteral("type")] = QStringLiteral("image");
            obj[QStringLiteral("source")] = source;
            return obj;
        },
        [](const ToolUseBlock& b) {
            QJsonObject obj;
            obj[QStringLiteral("type")] = QStringLiteral("tool_use");
            obj[QStringLiteral("id")] = b.id;
            obj[QStringLiteral("name")] = b.name;
            obj[QStringLiteral("input")] = b.input;
            return obj;
        },
        [](const ToolResultBlock& b) {
            QJsonObject obj;
            obj[QStringLiteral("type")] = QStringLiteral("tool_result");
            obj[QStringLiteral("tool_use_id")] = b.toolUseId;
            obj[QStringLiteral("content")] = b.content;
            if (b.isError)
                obj[QStringLiteral("is_error")] = true;
            return obj;
        },
        [](const ThinkingBlock& b) {
            QJsonObject obj;
            obj[QStringLiteral("type")] = QStringLiteral("thinking");
            obj[QStringLiteral("thinking")] = b.thinking;
            obj[QStringLiteral("signature")] = b.signature;
            return obj;
        },
    }, block);
}

QByteArray MessagesCodec::encodeResponse(const MessagesResponse& response)
{
    QJsonArray content;
    for (const ContentBlock& block : response.content)
        content.append(blockToJson(block));

    QJsonObject root;
    root[QStringLiteral("id")] = response.id;
    root[QStringLiteral("type")] = QStringLiteral("message");
    root[QStringLiteral("role")] = QStringLiteral("assistant");
    root[QStringLiteral("model")] = response.model;
    root[QStringLiteral("content")] = content;
    root[QStringLiteral("stop_reason")] = stopReasonName(response.stopReason);
    root[QStringLiteral("stop_sequence")] = QJsonValue::Null;
    root[QStringLiteral("usage")] = usageToJson(response.usage);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QString MessagesCodec::eventName(const StreamEvent& event)
{
    return std::visit(Overloaded{
        [](const MessageStartEvent&)      { return QStringLiteral("message_start"); },
        [](const ContentBlockStartEvent&) { return QStringLiteral("content_block_start"); },
        [](const ContentBlockDeltaEvent&) { return QStringLiteral("content_block_delta"); },
        [](const ContentBlockStopEvent&)  { return QStringLiteral("content_block_stop"); },
        [](const MessageDeltaEvent&)      { return QStringLiteral("message_delta"); },
        [](const MessageStopEvent&)       { return QStringLiteral("message_stop"); },
        [](const ErrorEvent&)             { return QStringLiteral("error"); },
    }, event);
}

QByteArray MessagesCodec::encodeEvent(const StreamEvent& event)
{
    const QString name = eventName(event);

    QJsonObject payload = std::visit(Overloaded{
        [](const MessageStartEvent& e) {
            QJsonObject message;
            message[QStringLiteral("id")] = e.id;
            message[QStringLiteral("type")] = QStringLiteral("message");
            message[QStringLiteral("role")] = QStringLiteral("assistant");
            message[QStringLiteral("content")] = QJsonArray();
            message[QStringLiteral("model")] = e.model;
            message[QStringLiteral("stop_reason")] = QJsonValue::Null;
            message[QStringLiteral("stop_sequence")] = QJsonValue::Null;
            message[QStringLiteral("usage")] = usageToJson(e.usage);
            QJsonObject obj;
            obj[QStringLiteral("message")] = message;
            return obj;
        },
        [](const ContentBlockStartEvent& e) {
            QJsonObject block;
            block[QStringLiteral("type")] = blockKindName(e.kind);
            switch (e.kind) {
            case BlockKind::Text:
                block[QStringLiteral("text")] = QStringLiteral("");
                break;
            case BlockKind::ToolUse:
                block[QStringLiteral("id")] = e.toolId;
                block[QStringLiteral("name")] = e.toolName;
                block[QStringLiteral("input")] = QJsonObject();
                break;
            case BlockKind::Thinking:
                block[QStringLiteral("thinking")] = QStringLiteral("");
                block[QStringLiteral("signature")] = QStringLiteral("");
                break;
            }
            QJsonObject obj;
            obj[QStringLiteral("index")] = e.index;
            obj[QStringLiteral("content_block")] = block;
            return obj;
        },
        [](const ContentBlockDeltaEvent& e) {
            QJsonObject delta;
            switch (e.kind) {
            case BlockKind::Text:
                delta[QStringLiteral("type")] = QStringLiteral("text_delta");
                delta[QStringLiteral("text")] = e.payload;
                break;
            case BlockKind::ToolUse:
                delta[QStringLiteral("type")] = QStringLiteral("input_json_delta");
                delta[QStringLiteral("partial_json")] = e.payload;
                break;
            case BlockKind::Thinking:
                delta[QStringLiteral("type")] = QStringLiteral("thinking_delta");
                delta[QStringLiteral("thinking")] = e.payload;
                break;
            }
            QJsonObject obj;
            obj[QStringLiteral("index")] = e.index;
            obj[QStringLiteral("delta")] = delta;
            return obj;
        },
        [](const ContentBlockStopEvent& e) {
            QJsonObject obj;
            obj[QStringLiteral("index")] = e.index;
            return obj;
        },
        [](const MessageDeltaEvent& e) {
            QJsonObject delta;
            delta[QStringLiteral("stop_reason")] = stopReasonName(e.stopReason);
            delta[QStringLiteral("stop_sequence")] = QJsonValue::Null;
            QJsonObject obj;
            obj[QStringLiteral("delta")] = delta;
            obj[QStringLiteral("usage")] = usageToJson(e.usage);
            return obj;
        },
        [](const MessageStopEvent&) { return QJsonObject(); },
        [](const ErrorEvent& e) {
            QJsonObject error;
            error[QStringLiteral("type")] = e.type;
            error[QStringLiteral("message")] = e.message;
            QJsonObject obj;
            obj[QStringLiteral("error")] = error;
            return obj;
        },
    }, event);

    payload[QStringLiteral("type")] = name;
    return sseFrame(name, payload);
}

QByteArray MessagesCodec::encodeFailure(const DomainFailure& failure)
{
    return QJsonDocument(failure.toJson()).toJson(QJsonDocument::Compact);
}

QByteArray MessagesCodec::encodeModelList(const ModelList& models)
{
    QJsonArray data;
    for (const ModelInfo& model : models) {
        QJsonObject out;
        out[QStringLiteral("type")] = QStringLiteral("model");
        out[QStringLiteral("id")] = model.clientId;
        out[QStringLiteral("display_name")] = model.displayName.isEmpty()
            ? model.clientId : model.displayName;
        if (model.created > 0) {
            out[QStringLiteral("created_at")] =
                QDateTime::fromSecsSinceEpoch(model.created, Qt::UTC).toString(Qt::ISODate);
        }
        data.append(out);
    }

    QJsonObject root;
    root[QStringLiteral("data")] = data;
    root[QStringLiteral("has_more")] = false;
    if (!models.isEmpty()) {
        root[QStringLiteral("first_id")] = models.first().clientId;
        root[QStringLiteral("last_id")] = models.last().clientId;
    }
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}
