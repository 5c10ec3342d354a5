#pragma once
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

struct ChatToolCall {
    QString id;
    QString name;
    QString arguments;
};

struct ChatContentPart {
    enum class Kind : quint8 { Text, ImageUrl };
    Kind kind = Kind::Text;
    QString text;
    QString url;
};

// content is plain text when parts is empty; a missing text encodes as null.
struct ChatMessage {
    QString role;
    std::optional<QString> text;
    QList<ChatContentPart> parts;
    QList<ChatToolCall> toolCalls;
    QString toolCallId;
};

struct ChatTool {
    QString name;
    QString description;
    QJsonObject parameters;
};

struct ChatRequest {
    QString model;
    QList<ChatMessage> messages;
    QList<ChatTool> tools;
    QJsonValue toolChoice;
    std::optional<int> maxTokens;
    std::optional<double> temperature;
    std::optional<double> topP;
    QStringList stop;
    bool stream = false;
    QString user;

    bool hasImages() const;
    // Conversations continuing after an assistant or tool turn are agent initiated.
    bool isAgentInitiated() const;
};

struct ChatUsage {
    int promptTokens = 0;
    int completionTokens = 0;
    int totalTokens = 0;
    int cachedTokens = 0;
};

struct ChatChoice {
    int index = 0;
    std::optional<QString> content;
    QList<ChatToolCall> toolCalls;
    QString finishReason;
};

struct ChatResponse {
    QString id;
    QString model;
    QList<ChatChoice> choices;
    std::optional<ChatUsage> usage;
};

// One streamed tool call fragment; slot is the backend's tool call index.
struct ChatToolCallDelta {
    int slot = 0;
    std::optional<QString> id;
    std::optional<QString> name;
    std::optional<QString> arguments;
};

struct ChatChunkChoice {
    int index = 0;
    std::optional<QString> content;
    QList<ChatToolCallDelta> toolCalls;
    QString finishReason;
};

struct ChatChunk {
    QString id;
    QString model;
    QList<ChatChunkChoice> choices;
    std::optional<ChatUsage> usage;
};

inline bool ChatRequest::hasImages() const
{
    for (const ChatMessage& message : messages) {
        for (const ChatContentPart& part : message.parts) {
            if (part.kind == ChatContentPart::Kind::ImageUrl)
                return true;
        }
    }
    return false;
}

inline bool ChatRequest::isAgentInitiated() const
{
    for (const ChatMessage& message : messages) {
        if (message.role == QStringLiteral("assistant") || message.role == QStringLiteral("tool"))
            return true;
    }
    return false;
}
