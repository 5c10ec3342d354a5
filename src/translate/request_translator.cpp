#include "request_translator.h"
#include "naming/model_renamer.h"
#include <QJsonDocument>

const QString RequestTranslator::kThinkingInstruction = QStringLiteral(
    "Before answering, reason step by step inside <thinking></thinking> tags. "
    "Put only your reasoning inside the tags and write the final answer after "
    "the closing </thinking> tag.");

RequestTranslator::RequestTranslator(const ModelRenamer* renamer,
                                     RequestTranslatorOptions options)
    : m_renamer(renamer)
    , m_options(options)
{
}

bool RequestTranslator::thinkingActive(const MessagesRequest& request) const
{
    return m_options.emulateThinking && request.thinkingRequested;
}

Result<ChatRequest> RequestTranslator::translate(const MessagesRequest& request) const
{
    if (request.model.isEmpty()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("translation.invalid_input"), QStringLiteral("model: field is required")));
    }

    ChatRequest out;
    out.model = m_renamer ? m_renamer->toBackend(request.model) : request.model;

    QStringList systemParts = request.system;
    if (thinkingActive(request))
        systemParts.append(kThinkingInstruction);
    if (!systemParts.isEmpty()) {
        ChatMessage system;
        system.role = QStringLiteral("system");
        system.text = systemParts.join(QStringLiteral("\n\n"));
        out.messages.append(system);
    }

    for (int i = 0; i < request.messages.size(); ++i) {
        const ClientMessage& message = request.messages.at(i);
        VoidResult appended;
        if (message.role == QStringLiteral("user")) {
            appended = appendUserMessage(message, i, out.messages);
        } else if (message.role == QStringLiteral("assistant")) {
            appended = appendAssistantMessage(message, i, out.messages);
        } else {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("translation.invalid_input"),
                QStringLiteral("messages[%1].role: unsupported role '%2'").arg(i).arg(message.role)));
        }
        if (!appended)
            return std::unexpected(appended.error());
    }

    for (int i = 0; i < request.tools.size(); ++i) {
        const ToolDefinition& tool = request.tools.at(i);
        if (tool.name.isEmpty()) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("translation.invalid_input"),
                QStringLiteral("tools[%1].name: field is required").arg(i)));
        }
        ChatTool mapped;
        mapped.name = tool.name;
        mapped.description = tool.description;
        mapped.parameters = tool.inputSchema;
        out.tools.append(mapped);
    }

    if (request.toolChoice)
        out.toolChoice = mapToolChoice(*request.toolChoice);

    if (request.maxTokens > 0)
        out.maxTokens = request.maxTokens;
    out.temperature = request.temperature;
    out.topP = request.topP;
    out.stop = request.stopSequences;
    out.stream = request.stream;
    out.user = request.userId;
    return out;
}

VoidResult RequestTranslator::appendUserMessage(const ClientMessage& message, int messageIndex,
                                                QList<ChatMessage>& out) const
{
    QList<ChatMessage> toolMessages;
    QStringList texts;
    QList<ChatContentPart> parts;
    bool hasImage = false;

    for (int j = 0; j < message.content.size(); ++j) {
        const QString field = QStringLiteral("messages[%1].content[%2]").arg(messageIndex).arg(j);
        VoidResult blockResult = std::visit(Overloaded{
            [&](const TextBlock& block) -> VoidResult {
                texts.append(block.text);
                parts.append(ChatContentPart{ChatContentPart::Kind::Text, block.text, QString()});
                return {};
            },
            [&](const ImageBlock& block) -> VoidResult {
                const QString url = block.url.isEmpty()
                    ? QStringLiteral("data:%1;base64,%2").arg(block.mediaType, block.data)
                    : block.url;
                parts.append(ChatContentPart{ChatContentPart::Kind::ImageUrl, QString(), url});
                hasImage = true;
                return {};
            },
            [&](const ToolResultBlock& block) -> VoidResult {
                if (block.toolUseId.isEmpty()) {
                    return std::unexpected(DomainFailure::invalidInput(
                        QStringLiteral("translation.invalid_input"),
                        field + QStringLiteral(".tool_use_id: field is required")));
                }
                ChatMessage tool;
                tool.role = QStringLiteral("tool");
                tool.toolCallId = block.toolUseId;
                tool.text = block.content;
                toolMessages.append(tool);
                return {};
            },
            [&](const ToolUseBlock&) -> VoidResult {
                return std::unexpected(DomainFailure::invalidInput(
                    QStringLiteral("translation.invalid_input"),
                    field + QStringLiteral(": tool_use blocks are only valid in assistant messages")));
            },
            [&](const ThinkingBlock&) -> VoidResult {
                return {};
            },
        }, message.content.at(j));
        if (!blockResult)
            return blockResult;
    }

    out.append(toolMessages);

    if (hasImage) {
        ChatMessage user;
        user.role = QStringLiteral("user");
        user.parts = parts;
        out.append(user);
    } else if (!texts.isEmpty()) {
        ChatMessage user;
        user.role = QStringLiteral("user");
        user.text = texts.join(QStringLiteral("\n\n"));
        out.append(user);
    } else if (toolMessages.isEmpty()) {
        // An empty user turn still has to reach the backend.
        ChatMessage user;
        user.role = QStringLiteral("user");
        user.text = QStringLiteral("");
        out.append(user);
    }
    return {};
}

VoidResult RequestTranslator::appendAssistantMessage(const ClientMessage& message, int messageIndex,
                                                     QList<ChatMessage>& out) const
{
    ChatMessage assistant;
    assistant.role = QStringLiteral("assistant");
    QStringList texts;

    for (int j = 0; j < message.content.size(); ++j) {
        const QString field = QStringLiteral("messages[%1].content[%2]").arg(messageIndex).arg(j);
        VoidResult blockResult = std::visit(Overloaded{
            [&](const TextBlock& block) -> VoidResult {
                if (!block.text.isEmpty())
                    texts.append(block.text);
                return {};
            },
            [&](const ThinkingBlock& block) -> VoidResult {
                if (!block.thinking.isEmpty())
                    texts.append(block.thinking);
                return {};
            },
            [&](const ToolUseBlock& block) -> VoidResult {
                if (block.id.isEmpty() || block.name.isEmpty()) {
                    return std::unexpected(DomainFailure::invalidInput(
                        QStringLiteral("translation.invalid_input"),
                        field + QStringLiteral(": tool_use requires id and name")));
                }
                ChatToolCall call;
                call.id = block.id;
                call.name = block.name;
                call.arguments = QString::fromUtf8(
                    QJsonDocument(block.input).toJson(QJsonDocument::Compact));
                assistant.toolCalls.append(call);
                return {};
            },
            [&](const ToolResultBlock&) -> VoidResult {
                return std::unexpected(DomainFailure::invalidInput(
                    QStringLiteral("translation.invalid_input"),
                    field + QStringLiteral(": tool_result blocks are only valid in user messages")));
            },
            [&](const ImageBlock&) -> VoidResult {
                return std::unexpected(DomainFailure::invalidInput(
                    QStringLiteral("translation.invalid_input"),
                    field + QStringLiteral(": image blocks are only valid in user messages")));
            },
        }, message.content.at(j));
        if (!blockResult)
            return blockResult;
    }

    if (!texts.isEmpty())
        assistant.text = texts.join(QStringLiteral("\n\n"));
    else if (assistant.toolCalls.isEmpty())
        assistant.text = QStringLiteral("");
    out.append(assistant);
    return {};
}

QJsonValue RequestTranslator::mapToolChoice(const ToolChoice& choice)
{
    return std::visit(Overloaded{
        [](const ToolChoiceAuto&) -> QJsonValue { return QStringLiteral("auto"); },
        [](const ToolChoiceAny&) -> QJsonValue { return QStringLiteral("required"); },
        [](const ToolChoiceNone&) -> QJsonValue { return QStringLiteral("none"); },
        [](const ToolChoiceTool& tool) -> QJsonValue {
            QJsonObject function;
            function[QStringLiteral("name")] = tool.name;
            QJsonObject forced;
            forced[QStringLiteral("type")] = QStringLiteral("function");
            forced[QStringLiteral("function")] = function;
            return forced;
        },
    }, choice);
}
