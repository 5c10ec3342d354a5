#pragma once
#include "client_types.h"
#include "chat_types.h"
#include "semantic/ports.h"

class ModelRenamer;

struct RequestTranslatorOptions {
    bool emulateThinking = true;
};

// Maps a decoded client request onto the backend chat-completion shape.
class RequestTranslator {
public:
    explicit RequestTranslator(const ModelRenamer* renamer,
                               RequestTranslatorOptions options = {});

    Result<ChatRequest> translate(const MessagesRequest& request) const;

    // True when the reply should be scanned for <thinking> segments.
    bool thinkingActive(const MessagesRequest& request) const;

    static const QString kThinkingInstruction;

private:
    const ModelRenamer* m_renamer;
    RequestTranslatorOptions m_options;

    VoidResult appendUserMessage(const ClientMessage& message, int messageIndex,
                                 QList<ChatMessage>& out) const;
    VoidResult appendAssistantMessage(const ClientMessage& message, int messageIndex,
                                      QList<ChatMessage>& out) const;
    static QJsonValue mapToolChoice(const ToolChoice& choice);
};
