#pragma once
#include "translate/chat_types.h"
#include "catalog/model_info.h"
#include "semantic/ports.h"
#include <QJsonArray>
#include <QJsonObject>

// Wire codec for the backend's chat-completion protocol.
class ChatCodec {
public:
    static QByteArray encodeRequest(const ChatRequest& request);
    static Result<ChatResponse> decodeResponse(const QByteArray& body);
    static Result<ChatChunk> decodeChunk(const QByteArray& data);
    static Result<ModelList> decodeModelList(const QByteArray& body);
    static QByteArray encodeModelList(const ModelList& models);

    static DomainFailure mapFailure(int httpStatus, const QByteArray& body);

private:
    static QJsonObject encodeMessage(const ChatMessage& message);
    static std::optional<ChatUsage> decodeUsage(const QJsonValue& value);
    static std::optional<QString> optionalString(const QJsonObject& obj, const QString& key);
};
