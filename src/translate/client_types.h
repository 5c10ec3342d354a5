#pragma once
#include "semantic/types.h"
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>
#include <variant>

// ---------------------------------------------------------------------------
// Content blocks
// ---------------------------------------------------------------------------

struct TextBlock {
    QString text;
};

// Inline base64 data or a remote url, never both.
struct ImageBlock {
    QString mediaType;
    QString data;
    QString url;
};

struct ToolUseBlock {
    QString id;
    QString name;
    QJsonObject input;
};

struct ToolResultBlock {
    QString toolUseId;
    QString content;
    bool isError = false;
};

struct ThinkingBlock {
    QString thinking;
    QString signature;
};

using ContentBlock = std::variant<TextBlock, ImageBlock, ToolUseBlock,
                                  ToolResultBlock, ThinkingBlock>;

struct ClientMessage {
    QString role;
    QList<ContentBlock> content;
};

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------

struct ToolDefinition {
    QString name;
    QString description;
    QJsonObject inputSchema;
};

struct ToolChoiceAuto {};
struct ToolChoiceAny {};
struct ToolChoiceNone {};
struct ToolChoiceTool {
    QString name;
};

using ToolChoice = std::variant<ToolChoiceAuto, ToolChoiceAny, ToolChoiceNone, ToolChoiceTool>;

// ---------------------------------------------------------------------------
// Request / response
// ---------------------------------------------------------------------------

struct MessagesRequest {
    QString model;
    QStringList system;
    QList<ClientMessage> messages;
    QList<ToolDefinition> tools;
    std::optional<ToolChoice> toolChoice;
    int maxTokens = 0;
    std::optional<double> temperature;
    std::optional<double> topP;
    QStringList stopSequences;
    bool stream = false;
    QString userId;
    bool thinkingRequested = false;
    int thinkingBudget = 0;
};

struct Usage {
    int inputTokens = 0;
    int outputTokens = 0;
    std::optional<int> cacheReadInputTokens;
};

struct MessagesResponse {
    QString id;
    QString model;
    QList<ContentBlock> content;
    StopReason stopReason = StopReason::EndTurn;
    Usage usage;
};

// ---------------------------------------------------------------------------
// Stream events
// ---------------------------------------------------------------------------

enum class BlockKind : quint8 { Text, ToolUse, Thinking };

struct MessageStartEvent {
    QString id;
    QString model;
    Usage usage;
};

struct ContentBlockStartEvent {
    int index = 0;
    BlockKind kind = BlockKind::Text;
    QString toolId;
    QString toolName;
};

struct ContentBlockDeltaEvent {
    int index = 0;
    BlockKind kind = BlockKind::Text;
    // Text, thinking text or a partial JSON fragment, depending on kind.
    QString payload;
};

struct ContentBlockStopEvent {
    int index = 0;
};

struct MessageDeltaEvent {
    StopReason stopReason = StopReason::EndTurn;
    Usage usage;
};

struct MessageStopEvent {};

struct ErrorEvent {
    QString type;
    QString message;
};

using StreamEvent = std::variant<MessageStartEvent, ContentBlockStartEvent,
                                 ContentBlockDeltaEvent, ContentBlockStopEvent,
                                 MessageDeltaEvent, MessageStopEvent, ErrorEvent>;

// Overload set for std::visit.
template<class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
