#include "sse_writer.h"
#include "core/log_manager.h"

void SseWriter::writeStreamHeader(QTcpSocket* socket)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_WARNING(QStringLiteral("SseWriter: cannot write stream header, socket not connected"));
        return;
    }

    const QByteArray header =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: keep-alive\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n";

    socket->write(header);
    socket->flush();
}

QByteArray SseWriter::wrapChunked(const QByteArray& data)
{
    // <hex-length>\r\n<data>\r\n
    QByteArray chunk;
    chunk.append(QByteArray::number(data.size(), 16));
    chunk.append("\r\n");
    chunk.append(data);
    chunk.append("\r\n");
    return chunk;
}

void SseWriter::sendChunk(QTcpSocket* socket, const QByteArray& sseData)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_DEBUG(QStringLiteral("SseWriter: dropping chunk, socket not connected"));
        return;
    }
    if (sseData.isEmpty())
        return;

    QByteArray sseFrame;
    const bool alreadySse =
        sseData.startsWith("event:") ||
        sseData.startsWith("data:") ||
        sseData.startsWith(":");

    if (alreadySse) {
        sseFrame = sseData;
    } else {
        sseFrame.append("data: ");
        sseFrame.append(sseData);
        sseFrame.append("\n\n");
    }

    socket->write(wrapChunked(sseFrame));
    socket->flush();
}

void SseWriter::sendTerminator(QTcpSocket* socket)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState)
        return;

    // Zero-length chunk ends the chunked body.
    socket->write("0\r\n\r\n");
    socket->flush();
}
