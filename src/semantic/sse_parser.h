#pragma once
#include <QByteArray>
#include <QList>
#include <QString>
#include <optional>

struct SseEvent {
    QString event;
    QByteArray data;
};

// Incremental Server-Sent Events parser. Bytes may arrive split at any
// position; only complete event blocks are returned.
class SseParser {
public:
    QList<SseEvent> push(const QByteArray& bytes);
    // Treats whatever is buffered as a final, complete block.
    QList<SseEvent> flush();
    void reset();

    int bufferedSize() const { return m_buffer.size(); }

private:
    QByteArray m_buffer;

    static std::optional<SseEvent> parseBlock(const QByteArray& block);
};
