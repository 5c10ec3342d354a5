#pragma once
#include "client_types.h"
#include "chat_types.h"
#include "semantic/ports.h"

class ModelRenamer;

class ResponseTranslator {
public:
    explicit ResponseTranslator(const ModelRenamer* renamer);

    // requestedModel is the model the client asked for; it names the reply
    // when present, otherwise the backend's model id is mapped.
    Result<MessagesResponse> translate(const ChatResponse& response,
                                       const QString& requestedModel,
                                       bool parseThinking) const;

    static StopReason mapFinishReason(const QString& finishReason);
    static Usage mapUsage(const std::optional<ChatUsage>& usage);
    // Tool arguments that do not decode to an object become {}.
    static QJsonObject decodeArguments(const QString& arguments);

private:
    const ModelRenamer* m_renamer;
};
