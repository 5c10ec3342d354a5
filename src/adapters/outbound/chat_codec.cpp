#include "chat_codec.h"
#include <QJsonDocument>

std::optional<QString> ChatCodec::optionalString(const QJsonObject& obj, const QString& key)
{
    const QJsonValue value = obj.value(key);
    if (!value.isString())
        return std::nullopt;
    return value.toString();
}

QJsonObject ChatCodec::encodeMessage(const ChatMessage& message)
{
    QJsonObject msg;
    msg[QStringLiteral("role")] = message.role;

    if (!message.parts.isEmpty()) {
        QJsonArray contentArr;
        for (const ChatContentPart& part : message.parts) {
            QJsonObject p;
            if (part.kind == ChatContentPart::Kind::Text) {
                p[QStringLiteral("type")] = QStringLiteral("text");
                p[QStringLiteral("text")] = part.text;
            } else {
                QJsonObject imageUrl;
                imageUrl[QStringLiteral("url")] = part.url;
                p[QStringLiteral("type")] = QStringLiteral("image_url");
                p[QStringLiteral("image_url")] = imageUrl;
            }
            contentArr.append(p);
        }
        msg[QStringLiteral("content")] = contentArr;
    } else if (message.text) {
        msg[QStringLiteral("content")] = *message.text;
    } else {
        msg[QStringLiteral("content")] = QJsonValue::Null;
    }

    if (!message.toolCalls.isEmpty()) {
        QJsonArray calls;
        for (const ChatToolCall& call : message.toolCalls) {
            QJsonObject function;
            function[QStringLiteral("name")] = call.name;
            function[QStringLiteral("arguments")] = call.arguments;
            QJsonObject tc;
            tc[QStringLiteral("id")] = call.id;
            tc[QStringLiteral("type")] = QStringLiteral("function");
            tc[QStringLiteral("function")] = function;
            calls.append(tc);
        }
        msg[QStringLiteral("tool_calls")] = calls;
    }

    if (!message.toolCallId.isEmpty())
        msg[QStringLiteral("tool_call_id")] = message.toolCallId;

    return msg;
}

QByteArray ChatCodec::encodeRequest(const ChatRequest& request)
{
    QJsonObject body;
    body[QStringLiteral("model")] = request.model;

    QJsonArray messages;
    for (const ChatMessage& message : request.messages)
        messages.append(encodeMessage(message));
    body[QStringLiteral("messages")] = messages;

    if (!request.tools.isEmpty()) {
        QJsonArray tools;
        for (const ChatTool& tool : request.tools) {
            QJsonObject function;
            function[QStringLiteral("name")] = tool.name;
            if (!tool.description.isEmpty())
                function[QStringLiteral("description")] = tool.description;
            function[QStringLiteral("parameters")] = tool.parameters;
            QJsonObject t;
            t[QStringLiteral("type")] = QStringLiteral("function");
            t[QStringLiteral("function")] = function;
            tools.append(t);
        }
        body[QStringLiteral("tools")] = tools;
    }

    if (!request.toolChoice.isUndefined() && !request.toolChoice.isNull())
        body[QStringLiteral("tool_choice")] = request.toolChoice;

    if (request.maxTokens)
        body[QStringLiteral("max_tokens")] = *request.maxTokens;
    if (request.temperature)
        body[QStringLiteral("temperature")] = *request.temperature;
    if (request.topP)
        body[QStringLiteral("top_p")] = *request.topP;

    if (request.stop.size() == 1)
        body[QStringLiteral("stop")] = request.stop.first();
    else if (request.stop.size() > 1)
        body[QStringLiteral("stop")] = QJsonArray::fromStringList(request.stop);

    if (request.stream)
        body[QStringLiteral("stream")] = true;
    if (!request.user.isEmpty())
        body[QStringLiteral("user")] = request.user;

    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

std::optional<ChatUsage> ChatCodec::decodeUsage(const QJsonValue& value)
{
    if (!value.isObject())
        return std::nullopt;
    const QJsonObject usage = value.toObject();
    ChatUsage out;
    out.promptTokens = usage.value(QStringLiteral("prompt_tokens")).toInt();
    out.completionTokens = usage.value(QStringLiteral("completion_tokens")).toInt();
    out.totalTokens = usage.value(QStringLiteral("total_tokens")).toInt();
    out.cachedTokens = usage.value(QStringLiteral("prompt_tokens_details")).toObject()
                           .value(QStringLiteral("cached_tokens")).toInt();
    return out;
}

Result<ChatResponse> ChatCodec::decodeResponse(const QByteArray& body)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::upstream(
            502, QStringLiteral("Failed to parse backend response JSON: ") + err.errorString()));
    }

    const QJsonObject root = doc.object();
    ChatResponse response;
    response.id = root.value(QStringLiteral("id")).toString();
    response.model = root.value(QStringLiteral("model")).toString();
    response.usage = decodeUsage(root.value(QStringLiteral("usage")));

    const QJsonArray choices = root.value(QStringLiteral("choices")).toArray();
    for (const QJsonValue& cv : choices) {
        const QJsonObject choiceObj = cv.toObject();
        const QJsonObject message = choiceObj.value(QStringLiteral("message")).toObject();

        ChatChoice choice;
        choice.index = choiceObj.value(QStringLiteral("index")).toInt();
        choice.content = optionalString(message, QStringLiteral("content"));
        choice.finishReason = choiceObj.value(QStringLiteral("finish_reason")).toString();

        const QJsonArray toolCalls = message.value(QStringLiteral("tool_calls")).toArray();
        for (const QJsonValue& tv : toolCalls) {
            const QJsonObject tc = tv.toObject();
            const QJsonObject function = tc.value(QStringLiteral("function")).toObject();
            choice.toolCalls.append(ChatToolCall{
                tc.value(QStringLiteral("id")).toString(),
                function.value(QStringLiteral("name")).toString(),
                function.value(QStringLiteral("arguments")).toString()});
        }
        response.choices.append(choice);
    }

    return response;
}

Result<ChatChunk> ChatCodec::decodeChunk(const QByteArray& data)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::upstream(
            502, QStringLiteral("Failed to parse backend chunk JSON: ") + err.errorString()));
    }

    const QJsonObject root = doc.object();
    const QJsonValue choicesValue = root.value(QStringLiteral("choices"));
    if (!choicesValue.isUndefined() && !choicesValue.isNull() && !choicesValue.isArray()) {
        return std::unexpected(DomainFailure::upstream(
            502, QStringLiteral("Backend chunk has a non-array 'choices' field")));
    }

    ChatChunk chunk;
    chunk.id = root.value(QStringLiteral("id")).toString();
    chunk.model = root.value(QStringLiteral("model")).toString();
    chunk.usage = decodeUsage(root.value(QStringLiteral("usage")));

    const QJsonArray choices = choicesValue.toArray();
    for (const QJsonValue& cv : choices) {
        const QJsonObject choiceObj = cv.toObject();
        const QJsonObject delta = choiceObj.value(QStringLiteral("delta")).toObject();

        ChatChunkChoice choice;
        choice.index = choiceObj.value(QStringLiteral("index")).toInt();
        choice.content = optionalString(delta, QStringLiteral("content"));
        choice.finishReason = choiceObj.value(QStringLiteral("finish_reason")).toString();

        const QJsonArray toolCalls = delta.value(QStringLiteral("tool_calls")).toArray();
        for (const QJsonValue& tv : toolCalls) {
            const QJsonObject tc = tv.toObject();
            const QJsonObject function = tc.value(QStringLiteral("function")).toObject();
            ChatToolCallDelta call;
            call.slot = tc.value(QStringLiteral("index")).toInt();
            call.id = optionalString(tc, QStringLiteral("id"));
            call.name = optionalString(function, QStringLiteral("name"));
            call.arguments = optionalString(function, QStringLiteral("arguments"));
            choice.toolCalls.append(call);
        }
        chunk.choices.append(choice);
    }

    return chunk;
}

Result<ModelList> ChatCodec::decodeModelList(const QByteArray& body)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::upstream(
            502, QStringLiteral("Failed to parse model list JSON: ") + err.errorString()));
    }

    ModelList models;
    QStringList seenIds;
    const QJsonArray data = doc.object().value(QStringLiteral("data")).toArray();
    for (const QJsonValue& item : data) {
        const QJsonObject obj = item.toObject();
        const QString id = obj.value(QStringLiteral("id")).toString();
        if (id.isEmpty() || seenIds.contains(id))
            continue;
        seenIds.append(id);

        ModelInfo model;
        model.backendId = id;
        model.clientId = id;
        model.displayName = obj.value(QStringLiteral("name")).toString();
        model.vendor = obj.value(QStringLiteral("vendor")).toString();
        model.created = obj.value(QStringLiteral("created")).toVariant().toLongLong();
        models.append(model);
    }
    return models;
}

QByteArray ChatCodec::encodeModelList(const ModelList& models)
{
    QJsonArray data;
    for (const ModelInfo& model : models) {
        QJsonObject out;
        out[QStringLiteral("id")] = model.clientId;
        out[QStringLiteral("object")] = QStringLiteral("model");
        out[QStringLiteral("created")] = model.created;
        out[QStringLiteral("owned_by")] = model.vendor.isEmpty()
            ? QStringLiteral("github-copilot") : model.vendor;
        if (!model.displayName.isEmpty())
            out[QStringLiteral("display_name")] = model.displayName;
        data.append(out);
    }

    QJsonObject root;
    root[QStringLiteral("object")] = QStringLiteral("list");
    root[QStringLiteral("data")] = data;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

DomainFailure ChatCodec::mapFailure(int httpStatus, const QByteArray& body)
{
    QString message;

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error == QJsonParseError::NoError && doc.isObject()) {
        const QJsonValue errorValue = doc.object().value(QStringLiteral("error"));
        if (errorValue.isObject())
            message = errorValue.toObject().value(QStringLiteral("message")).toString();
        else if (errorValue.isString())
            message = errorValue.toString();
        if (message.isEmpty())
            message = doc.object().value(QStringLiteral("message")).toString();
    }

    if (message.isEmpty() && !body.trimmed().isEmpty())
        message = QString::fromUtf8(body.left(512)).trimmed();
    if (message.isEmpty())
        message = QStringLiteral("Backend error (HTTP %1)").arg(httpStatus);

    DomainFailure failure = DomainFailure::upstream(httpStatus, message);
    failure.retryable = (httpStatus == 429 || httpStatus >= 500);
    failure.temporary = failure.retryable;
    return failure;
}
