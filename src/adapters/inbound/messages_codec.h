#pragma once
#include "translate/client_types.h"
#include "catalog/model_info.h"
#include "semantic/ports.h"
#include <QJsonArray>
#include <QJsonObject>

// Wire codec for the client protocol (Messages API): request decoding,
// response and SSE event encoding, error envelopes and model listings.
class MessagesCodec {
public:
    static Result<MessagesRequest> decodeRequest(const QByteArray& body);

    static QByteArray encodeResponse(const MessagesResponse& response);
    static QByteArray encodeEvent(const StreamEvent& event);
    static QByteArray encodeFailure(const DomainFailure& failure);
    static QByteArray encodeModelList(const ModelList& models);

    static QString eventName(const StreamEvent& event);
    static QString stopReasonName(StopReason reason);
    static QJsonObject blockToJson(const ContentBlock& block);
    static QJsonObject usageToJson(const Usage& usage);

private:
    static Result<QList<ContentBlock>> decodeContent(const QJsonValue& content,
                                                     const QString& field);
    static Result<ContentBlock> decodeBlock(const QJsonObject& block, const QString& field);
    static Result<QStringList> decodeSystem(const QJsonValue& system);
    static Result<ToolChoice> decodeToolChoice(const QJsonValue& value);
    static QString flattenToolResultContent(const QJsonValue& content);
};
