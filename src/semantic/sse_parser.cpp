#include "sse_parser.h"

QList<SseEvent> SseParser::push(const QByteArray& bytes)
{
    m_buffer.append(bytes);

    QList<SseEvent> events;
    while (true) {
        // "\r\n\r\n" is checked first so a CRLF stream never matches half a delimiter.
        int delimPos = -1;
        int delimLen = 0;

        const int crlfPos = m_buffer.indexOf("\r\n\r\n");
        const int lfPos = m_buffer.indexOf("\n\n");

        if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos)) {
            delimPos = crlfPos;
            delimLen = 4;
        } else if (lfPos >= 0) {
            delimPos = lfPos;
            delimLen = 2;
        }

        if (delimPos < 0)
            break;

        const QByteArray block = m_buffer.left(delimPos);
        m_buffer.remove(0, delimPos + delimLen);

        if (auto event = parseBlock(block))
            events.append(*event);
    }
    return events;
}

QList<SseEvent> SseParser::flush()
{
    if (m_buffer.trimmed().isEmpty()) {
        m_buffer.clear();
        return {};
    }
    return push(QByteArrayLiteral("\n\n"));
}

void SseParser::reset()
{
    m_buffer.clear();
}

std::optional<SseEvent> SseParser::parseBlock(const QByteArray& block)
{
    SseEvent event;
    QList<QByteArray> dataLines;

    for (const QByteArray& rawLine : block.split('\n')) {
        QByteArray line = rawLine;
        if (line.endsWith('\r'))
            line.chop(1);

        // Empty lines and ":" heartbeat comments carry nothing.
        if (line.isEmpty() || line.startsWith(':'))
            continue;

        if (line.startsWith("event:")) {
            event.event = QString::fromUtf8(line.mid(6).trimmed());
        } else if (line.startsWith("data:")) {
            QByteArray value = line.mid(5);
            if (value.startsWith(' '))
                value.remove(0, 1);
            dataLines.append(value);
        }
        // id:, retry: and unknown fields are ignored.
    }

    if (dataLines.isEmpty())
        return std::nullopt;

    event.data = dataLines.join('\n');
    return event;
}
