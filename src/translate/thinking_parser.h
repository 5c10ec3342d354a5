#pragma once
#include "client_types.h"
#include <QList>
#include <QString>

// Splits <thinking>...</thinking> segments out of assistant text.
//
// Batch form: returns text and thinking blocks in order. Whitespace-only
// text around thinking segments is dropped; an unclosed tag leaves the rest
// as text; text without tags comes back as one text block.
QList<ContentBlock> parseThinkingBlocks(const QString& text);

struct ThinkingEvent {
    enum class Kind : quint8 { TextDelta, ThinkingStart, ThinkingDelta, ThinkingEnd };
    Kind kind = Kind::TextDelta;
    QString text;
};

// Incremental form. Text that could be the beginning of a split tag is held
// back until the next push or finish().
class ThinkingStreamParser {
public:
    QList<ThinkingEvent> push(const QString& chunk);
    QList<ThinkingEvent> finish();

    bool insideThinking() const { return m_inThinking; }
    int bufferedLength() const { return m_buffer.size(); }

    static const QString kOpenTag;
    static const QString kCloseTag;

private:
    QString m_buffer;
    bool m_inThinking = false;

    static int partialTagLength(const QString& buffer, const QString& tag);
};
