#include "stream_translator.h"
#include "response_translator.h"
#include "core/log_manager.h"
#include <QUuid>

StreamTranslator::StreamTranslator(const QString& model, bool parseThinking)
    : m_model(model)
    , m_parseThinking(parseThinking)
{
}

QList<StreamEvent> StreamTranslator::translate(const ChatChunk& chunk)
{
    QList<StreamEvent> events;
    if (m_state.terminated) {
        LOG_DEBUG(QStringLiteral("StreamTranslator: chunk after terminal event ignored"));
        return events;
    }

    ensureStarted(&chunk, events);
    if (chunk.usage)
        m_usage = ResponseTranslator::mapUsage(chunk.usage);

    if (chunk.choices.isEmpty())
        return events;

    const ChatChunkChoice& choice = chunk.choices.first();
    if (choice.content && !choice.content->isEmpty())
        handleContent(*choice.content, events);

    for (const ChatToolCallDelta& delta : choice.toolCalls)
        handleToolCall(delta, events);

    if (!choice.finishReason.isEmpty())
        terminate(ResponseTranslator::mapFinishReason(choice.finishReason), events);

    return events;
}

QList<StreamEvent> StreamTranslator::finish()
{
    QList<StreamEvent> events;
    if (m_state.terminated)
        return events;
    ensureStarted(nullptr, events);
    terminate(StopReason::EndTurn, events);
    return events;
}

QList<StreamEvent> StreamTranslator::fail(const DomainFailure& failure)
{
    QList<StreamEvent> events;
    if (m_state.terminated)
        return events;
    events.append(ErrorEvent{failure.errorType(), failure.message});
    m_state.openBlock.reset();
    m_state.terminated = true;
    return events;
}

void StreamTranslator::ensureStarted(const ChatChunk* chunk, QList<StreamEvent>& events)
{
    if (m_state.messageStarted)
        return;

    MessageStartEvent start;
    start.id = (chunk && !chunk->id.isEmpty())
        ? chunk->id
        : QStringLiteral("msg_") + QUuid::createUuid().toString(QUuid::Id128);
    start.model = m_model;
    if (chunk) {
        start.usage = ResponseTranslator::mapUsage(chunk->usage);
        start.usage.outputTokens = 0;
    }
    events.append(start);
    m_state.messageStarted = true;
}

void StreamTranslator::closeOpenBlock(QList<StreamEvent>& events)
{
    if (!m_state.openBlock)
        return;
    events.append(ContentBlockStopEvent{m_state.openBlock->index});
    m_state.openBlock.reset();
}

int StreamTranslator::openBlock(BlockKind kind, QList<StreamEvent>& events,
                                const QString& toolId, const QString& toolName)
{
    closeOpenBlock(events);
    const int index = m_state.nextIndex++;
    events.append(ContentBlockStartEvent{index, kind, toolId, toolName});
    m_state.openBlock = OpenBlock{index, kind};
    return index;
}

void StreamTranslator::emitText(BlockKind kind, const QString& text, QList<StreamEvent>& events)
{
    if (text.isEmpty())
        return;
    if (!m_state.openBlock || m_state.openBlock->kind != kind)
        openBlock(kind, events);
    events.append(ContentBlockDeltaEvent{m_state.openBlock->index, kind, text});
}

void StreamTranslator::handleContent(const QString& text, QList<StreamEvent>& events)
{
    if (m_parseThinking)
        applyThinkingEvents(m_thinking.push(text), events);
    else
        emitText(BlockKind::Text, text, events);
}

void StreamTranslator::applyThinkingEvents(const QList<ThinkingEvent>& thinkingEvents,
                                           QList<StreamEvent>& events)
{
    for (const ThinkingEvent& ev : thinkingEvents) {
        switch (ev.kind) {
        case ThinkingEvent::Kind::TextDelta:
            emitText(BlockKind::Text, ev.text, events);
            break;
        case ThinkingEvent::Kind::ThinkingStart:
            closeOpenBlock(events);
            break;
        case ThinkingEvent::Kind::ThinkingDelta:
            emitText(BlockKind::Thinking, ev.text, events);
            break;
        case ThinkingEvent::Kind::ThinkingEnd:
            if (m_state.openBlock && m_state.openBlock->kind == BlockKind::Thinking)
                closeOpenBlock(events);
            break;
        }
    }
}

void StreamTranslator::flushThinking(QList<StreamEvent>& events)
{
    if (m_parseThinking)
        applyThinkingEvents(m_thinking.finish(), events);
}

void StreamTranslator::handleToolCall(const ChatToolCallDelta& delta, QList<StreamEvent>& events)
{
    flushThinking(events);

    const bool hasIdentity = delta.id && !delta.id->isEmpty()
                             && delta.name && !delta.name->isEmpty();
    auto existing = m_state.toolCalls.find(delta.slot);
    const bool fresh = hasIdentity
        && (existing == m_state.toolCalls.end() || existing->id != *delta.id);

    if (fresh) {
        const int index = openBlock(BlockKind::ToolUse, events, *delta.id, *delta.name);
        m_state.toolCalls.insert(delta.slot, ToolCallAccumulator{*delta.id, *delta.name, QString(), index});
    }

    if (!delta.arguments || delta.arguments->isEmpty())
        return;

    auto acc = m_state.toolCalls.find(delta.slot);
    if (acc == m_state.toolCalls.end()) {
        LOG_WARNING(QStringLiteral("StreamTranslator: arguments for unknown tool call slot %1 skipped")
                        .arg(delta.slot));
        return;
    }

    acc->arguments += *delta.arguments;
    if (!m_state.openBlock || m_state.openBlock->index != acc->blockIndex) {
        LOG_WARNING(QStringLiteral("StreamTranslator: arguments for closed tool block %1 skipped")
                        .arg(acc->blockIndex));
        return;
    }
    events.append(ContentBlockDeltaEvent{acc->blockIndex, BlockKind::ToolUse, *delta.arguments});
}

void StreamTranslator::terminate(StopReason reason, QList<StreamEvent>& events)
{
    flushThinking(events);
    closeOpenBlock(events);
    events.append(MessageDeltaEvent{reason, m_usage});
    events.append(MessageStopEvent{});
    m_state.terminated = true;
}
