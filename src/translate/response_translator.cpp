#include "response_translator.h"
#include "thinking_parser.h"
#include "naming/model_renamer.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QUuid>

ResponseTranslator::ResponseTranslator(const ModelRenamer* renamer)
    : m_renamer(renamer)
{
}

StopReason ResponseTranslator::mapFinishReason(const QString& finishReason)
{
    if (finishReason == QStringLiteral("stop"))
        return StopReason::EndTurn;
    if (finishReason == QStringLiteral("length"))
        return StopReason::MaxTokens;
    if (finishReason == QStringLiteral("tool_calls") || finishReason == QStringLiteral("function_call"))
        return StopReason::ToolUse;
    if (finishReason == QStringLiteral("content_filter"))
        return StopReason::Refusal;
    return StopReason::Other;
}

Usage ResponseTranslator::mapUsage(const std::optional<ChatUsage>& usage)
{
    Usage mapped;
    if (!usage)
        return mapped;
    mapped.inputTokens = qMax(0, usage->promptTokens - usage->cachedTokens);
    mapped.outputTokens = usage->completionTokens;
    if (usage->cachedTokens > 0)
        mapped.cacheReadInputTokens = usage->cachedTokens;
    return mapped;
}

QJsonObject ResponseTranslator::decodeArguments(const QString& arguments)
{
    if (arguments.trimmed().isEmpty())
        return QJsonObject();
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(arguments.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARNING(QStringLiteral("ResponseTranslator: tool arguments are not a JSON object: %1")
                        .arg(arguments.left(200)));
        return QJsonObject();
    }
    return doc.object();
}

Result<MessagesResponse> ResponseTranslator::translate(const ChatResponse& response,
                                                       const QString& requestedModel,
                                                       bool parseThinking) const
{
    if (response.choices.isEmpty()) {
        return std::unexpected(DomainFailure::upstream(
            502, QStringLiteral("backend response contains no choices")));
    }

    MessagesResponse out;
    out.id = response.id.isEmpty()
        ? QStringLiteral("msg_") + QUuid::createUuid().toString(QUuid::Id128)
        : response.id;
    const QString modelSource = requestedModel.isEmpty() ? response.model : requestedModel;
    out.model = m_renamer ? m_renamer->toClient(modelSource) : modelSource;

    // Choices are merged: text from every choice first, then every tool call.
    // A tool_calls finish on any choice wins over the first choice's reason.
    QList<ContentBlock> toolBlocks;
    out.stopReason = mapFinishReason(response.choices.first().finishReason);
    for (const ChatChoice& choice : response.choices) {
        if (choice.content && !choice.content->isEmpty()) {
            if (parseThinking)
                out.content.append(parseThinkingBlocks(*choice.content));
            else
                out.content.append(TextBlock{*choice.content});
        }

        for (const ChatToolCall& call : choice.toolCalls)
            toolBlocks.append(ToolUseBlock{call.id, call.name, decodeArguments(call.arguments)});

        if (mapFinishReason(choice.finishReason) == StopReason::ToolUse)
            out.stopReason = StopReason::ToolUse;
    }
    out.content.append(toolBlocks);

    out.usage = mapUsage(response.usage);
    return out;
}
