#include "thinking_parser.h"

const QString ThinkingStreamParser::kOpenTag = QStringLiteral("<thinking>");
const QString ThinkingStreamParser::kCloseTag = QStringLiteral("</thinking>");

QList<ContentBlock> parseThinkingBlocks(const QString& text)
{
    const QString& openTag = ThinkingStreamParser::kOpenTag;
    const QString& closeTag = ThinkingStreamParser::kCloseTag;

    QList<ContentBlock> blocks;
    bool foundThinking = false;
    qsizetype pos = 0;

    while (true) {
        const qsizetype start = text.indexOf(openTag, pos);
        if (start < 0)
            break;

        const qsizetype contentStart = start + openTag.size();
        const qsizetype end = text.indexOf(closeTag, contentStart);
        if (end < 0)
            break;

        foundThinking = true;
        const QString prefix = text.mid(pos, start - pos);
        if (!prefix.trimmed().isEmpty())
            blocks.append(TextBlock{prefix});
        blocks.append(ThinkingBlock{text.mid(contentStart, end - contentStart), QString()});
        pos = end + closeTag.size();
    }

    if (!foundThinking) {
        if (text.isEmpty())
            return blocks;
        blocks.append(TextBlock{text});
        return blocks;
    }

    const QString rest = text.mid(pos);
    if (!rest.isEmpty())
        blocks.append(TextBlock{rest});
    return blocks;
}

int ThinkingStreamParser::partialTagLength(const QString& buffer, const QString& tag)
{
    const int maxLen = qMin<int>(buffer.size(), tag.size() - 1);
    for (int len = maxLen; len > 0; --len) {
        if (QStringView(buffer).right(len) == QStringView(tag).left(len))
            return len;
    }
    return 0;
}

QList<ThinkingEvent> ThinkingStreamParser::push(const QString& chunk)
{
    using Kind = ThinkingEvent::Kind;

    m_buffer.append(chunk);
    QList<ThinkingEvent> events;

    while (!m_buffer.isEmpty()) {
        const QString& tag = m_inThinking ? kCloseTag : kOpenTag;
        const Kind deltaKind = m_inThinking ? Kind::ThinkingDelta : Kind::TextDelta;

        const qsizetype tagPos = m_buffer.indexOf(tag);
        if (tagPos >= 0) {
            if (tagPos > 0)
                events.append(ThinkingEvent{deltaKind, m_buffer.left(tagPos)});
            events.append(ThinkingEvent{m_inThinking ? Kind::ThinkingEnd : Kind::ThinkingStart, QString()});
            m_buffer.remove(0, tagPos + tag.size());
            m_inThinking = !m_inThinking;
            continue;
        }

        const int held = partialTagLength(m_buffer, tag);
        const qsizetype emitLen = m_buffer.size() - held;
        if (emitLen > 0) {
            events.append(ThinkingEvent{deltaKind, m_buffer.left(emitLen)});
            m_buffer.remove(0, emitLen);
        }
        break;
    }

    return events;
}

QList<ThinkingEvent> ThinkingStreamParser::finish()
{
    QList<ThinkingEvent> events;
    if (!m_buffer.isEmpty()) {
        events.append(ThinkingEvent{m_inThinking ? ThinkingEvent::Kind::ThinkingDelta
                                                 : ThinkingEvent::Kind::TextDelta,
                                    m_buffer});
        m_buffer.clear();
    }
    if (m_inThinking) {
        events.append(ThinkingEvent{ThinkingEvent::Kind::ThinkingEnd, QString()});
        m_inThinking = false;
    }
    return events;
}
