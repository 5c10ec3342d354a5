#pragma once
#include "client_types.h"
#include "chat_types.h"
#include "thinking_parser.h"
#include "semantic/failure.h"
#include <QMap>
#include <optional>

struct ToolCallAccumulator {
    QString id;
    QString name;
    QString arguments;
    int blockIndex = 0;
};

struct OpenBlock {
    int index = 0;
    BlockKind kind = BlockKind::Text;
};

struct StreamState {
    bool messageStarted = false;
    std::optional<OpenBlock> openBlock;
    int nextIndex = 0;
    QMap<int, ToolCallAccumulator> toolCalls;
    bool terminated = false;
};

// Per-connection state machine turning backend chunks into client events.
//
// At most one block is open at a time, block indices increase strictly and
// are never reused, message_start is emitted once and message_stop once,
// after every block has been closed. Not thread-safe; one instance per stream.
class StreamTranslator {
public:
    // model is the client-facing model id reported in message_start.
    StreamTranslator(const QString& model, bool parseThinking);

    QList<StreamEvent> translate(const ChatChunk& chunk);
    // Upstream ended without a finish reason ([DONE] or connection close).
    QList<StreamEvent> finish();
    // Upstream aborted; emits a terminal error event.
    QList<StreamEvent> fail(const DomainFailure& failure);

    const StreamState& state() const { return m_state; }
    bool isTerminated() const { return m_state.terminated; }

private:
    QString m_model;
    bool m_parseThinking;
    StreamState m_state;
    ThinkingStreamParser m_thinking;
    Usage m_usage;

    void ensureStarted(const ChatChunk* chunk, QList<StreamEvent>& events);
    void closeOpenBlock(QList<StreamEvent>& events);
    int openBlock(BlockKind kind, QList<StreamEvent>& events,
                  const QString& toolId = QString(), const QString& toolName = QString());
    void emitText(BlockKind kind, const QString& text, QList<StreamEvent>& events);
    void handleContent(const QString& text, QList<StreamEvent>& events);
    void handleToolCall(const ChatToolCallDelta& delta, QList<StreamEvent>& events);
    void flushThinking(QList<StreamEvent>& events);
    void applyThinkingEvents(const QList<ThinkingEvent>& thinkingEvents,
                             QList<StreamEvent>& events);
    void terminate(StopReason reason, QList<StreamEvent>& events);
};
