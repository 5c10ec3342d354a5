#include "proxy_server.h"
#include "sse_writer.h"
#include "adapters/inbound/messages_codec.h"
#include "adapters/outbound/chat_codec.h"
#include "auth/token_extractor.h"
#include "core/log_manager.h"
#include "pipeline/pipeline.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QPointer>

// ========================================================================
// Construction / destruction
// ========================================================================

ProxyServer::ProxyServer(QObject* parent)
    : QObject(parent)
{
    m_router.registerDefaults();
}

ProxyServer::~ProxyServer()
{
    stop();
}

void ProxyServer::setPipeline(Pipeline* pipeline)
{
    m_pipeline = pipeline;
}

// ========================================================================
// start / stop
// ========================================================================

bool ProxyServer::start(quint16 port, const QHostAddress& address)
{
    if (m_server) {
        stop();
    }

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::newConnection,
            this, &ProxyServer::onNewConnection);

    if (!m_server->listen(address, port)) {
        LOG_ERROR(QStringLiteral("ProxyServer: failed to listen on port %1 - %2")
                      .arg(port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("ProxyServer: listening on %1:%2")
                 .arg(address.toString())
                 .arg(m_server->serverPort()));
    emit statusChanged(true);
    return true;
}

void ProxyServer::stop()
{
    if (!m_server) {
        return;
    }

    for (auto it = m_activeSessions.begin(); it != m_activeSessions.end(); ++it) {
        PipelineStreamSession* session = it.value();
        if (session) {
            session->abort();
            session->deleteLater();
        }
    }
    m_activeSessions.clear();

    const QList<QTcpSocket*> sockets = m_pendingData.keys();
    m_pendingData.clear();
    for (QTcpSocket* socket : sockets) {
        socket->disconnectFromHost();
    }

    m_server->close();
    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("ProxyServer: server stopped"));
    emit statusChanged(false);
}

bool ProxyServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 ProxyServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// Connection handling
// ========================================================================

void ProxyServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        m_pendingData.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead,
                this, &ProxyServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &ProxyServer::onSocketDisconnected);

        LOG_DEBUG(QStringLiteral("ProxyServer: new connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

void ProxyServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData[socket] += socket->readAll();

    while (m_pendingData.contains(socket)) {
        QByteArray& buffer = m_pendingData[socket];
        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            return;
        }

        qint64 contentLength = 0;
        bool hasChunkedTransfer = false;
        const QString headerBlock = QString::fromUtf8(buffer.left(headerEnd));
        const QStringList headerLines = headerBlock.split(QStringLiteral("\r\n"));
        for (const QString& line : headerLines) {
            if (line.startsWith(QStringLiteral("Content-Length:"), Qt::CaseInsensitive)) {
                contentLength = qMax<qint64>(0, line.mid(15).trimmed().toLongLong());
            }
            if (line.startsWith(QStringLiteral("Transfer-Encoding:"), Qt::CaseInsensitive)
                && line.contains(QStringLiteral("chunked"), Qt::CaseInsensitive)) {
                hasChunkedTransfer = true;
            }
        }

        if (hasChunkedTransfer) {
            sendFailure(socket, DomainFailure::notSupported(
                                    QStringLiteral("chunked_body"),
                                    QStringLiteral("chunked request bodies are not supported")));
            buffer.clear();
            return;
        }

        if (contentLength > m_maxBodyBytes) {
            LOG_WARNING(QStringLiteral("ProxyServer: rejecting %1 byte body (limit %2)")
                            .arg(contentLength)
                            .arg(m_maxBodyBytes));
            disconnect(socket, &QTcpSocket::readyRead, this, &ProxyServer::onSocketReadyRead);
            m_pendingData.remove(socket);
            sendFailure(socket, DomainFailure::payloadTooLarge(contentLength, m_maxBodyBytes));
            socket->disconnectFromHost();
            return;
        }

        const int bodyStart = headerEnd + 4;
        const int totalRequired = bodyStart + static_cast<int>(contentLength);
        if (buffer.size() < totalRequired) {
            return;
        }

        const QByteArray requestData = buffer.left(totalRequired);
        buffer.remove(0, totalRequired);

        const HttpRequest req = parseHttpRequest(requestData);
        handleRequest(socket, req);

        // handleRequest may have re-entered the event loop; the socket can be gone.
        if (!m_pendingData.contains(socket)
            || socket->state() != QAbstractSocket::ConnectedState) {
            return;
        }
    }
}

void ProxyServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData.remove(socket);

    PipelineStreamSession* session = m_activeSessions.take(socket);
    if (session) {
        LOG_INFO(QStringLiteral("ProxyServer: client disconnected mid-stream, aborting backend reply"));
        session->abort();
        session->deleteLater();
    }

    socket->deleteLater();
    LOG_DEBUG(QStringLiteral("ProxyServer: client disconnected"));
}

// ========================================================================
// parseHttpRequest
// ========================================================================

ProxyServer::HttpRequest ProxyServer::parseHttpRequest(const QByteArray& data)
{
    HttpRequest req;

    int headerEnd = data.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return req;
    }

    QString headerBlock = QString::fromUtf8(data.left(headerEnd));
    QStringList lines = headerBlock.split(QStringLiteral("\r\n"));

    // Request line: "METHOD PATH HTTP/1.1"
    if (!lines.isEmpty()) {
        QStringList parts = lines[0].split(QLatin1Char(' '));
        if (parts.size() >= 3) {
            req.method      = parts[0].trimmed().toUpper();
            req.path        = parts[1];
            req.httpVersion = parts[2];
        }
    }

    for (int i = 1; i < lines.size(); ++i) {
        int colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon > 0) {
            QString key   = lines[i].left(colon).trimmed().toLower();
            QString value = lines[i].mid(colon + 1).trimmed();
            req.headers[key] = value;
        }
    }

    req.body = data.mid(headerEnd + 4);
    req.contentLength = req.body.size();
    req.complete = true;

    return req;
}

// ========================================================================
// handleRequest
// ========================================================================

void ProxyServer::handleRequest(QTcpSocket* socket, const HttpRequest& request)
{
    LOG_INFO(QStringLiteral("ProxyServer: %1 %2").arg(request.method, request.path));

    if (request.method == QStringLiteral("OPTIONS")) {
        sendCorsPreflight(socket);
        return;
    }

    auto routeOpt = m_router.match(request.method, request.path);
    if (!routeOpt) {
        sendFailure(socket, DomainFailure::notFound(
                                QStringLiteral("route not found: %1 %2")
                                    .arg(request.method, request.path)));
        return;
    }

    if (routeOpt->kind == RouteKind::Health) {
        sendHttpResponse(socket, 200, QByteArrayLiteral("{\"status\":\"ok\"}"));
        return;
    }

    if (!m_pipeline) {
        sendFailure(socket, DomainFailure::unavailable(QStringLiteral("pipeline not configured")));
        return;
    }

    switch (routeOpt->kind) {
    case RouteKind::Messages:
        handleMessages(socket, request);
        break;
    case RouteKind::ChatCompletions:
        handleChatCompletions(socket, request);
        break;
    case RouteKind::Models:
        handleModelsRequest(socket, request);
        break;
    case RouteKind::Health:
        break;
    }
}

void ProxyServer::handleMessages(QTcpSocket* socket, const HttpRequest& request)
{
    const QMap<QString, QString> metadata = buildMetadata(request);

    if (Pipeline::isStreamRequest(request.body)) {
        auto result = m_pipeline->processStream(request.body, metadata);
        if (!result) {
            sendFailure(socket, result.error());
            return;
        }
        sendStreamResponse(socket, *result);
        return;
    }

    auto result = m_pipeline->process(request.body, metadata);
    if (!result) {
        sendFailure(socket, result.error());
        return;
    }
    sendHttpResponse(socket, 200, *result);
}

void ProxyServer::handleChatCompletions(QTcpSocket* socket, const HttpRequest& request)
{
    const QMap<QString, QString> metadata = buildMetadata(request);

    if (Pipeline::isStreamRequest(request.body)) {
        auto result = m_pipeline->passthroughStream(request.body, metadata);
        if (!result) {
            sendFailure(socket, result.error());
            return;
        }
        sendStreamResponse(socket, *result);
        return;
    }

    auto result = m_pipeline->passthrough(request.body, metadata);
    if (!result) {
        sendFailure(socket, result.error());
        return;
    }

    const int status = result->statusCode > 0 ? result->statusCode : 502;
    const QString contentType = result->headers.value(QStringLiteral("content-type"),
                                                      QStringLiteral("application/json"));
    sendHttpResponse(socket, status, result->body, contentType);
}

void ProxyServer::handleModelsRequest(QTcpSocket* socket, const HttpRequest& request)
{
    const bool preferAnthropicSchema =
        request.headers.contains(QStringLiteral("anthropic-version"))
        || request.headers.contains(QStringLiteral("x-api-key"));

    QPointer<QTcpSocket> guard(socket);
    m_pipeline->listModels(buildMetadata(request))
        .then(this, [this, guard, preferAnthropicSchema](QFuture<Result<ModelList>> future) {
            if (!guard) {
                LOG_DEBUG(QStringLiteral("ProxyServer: model list ready but client is gone"));
                return;
            }
            if (future.resultCount() == 0) {
                sendFailure(guard, DomainFailure::unavailable(
                                       QStringLiteral("model list fetch was cancelled")));
                return;
            }

            const Result<ModelList> models = future.result();
            if (!models) {
                LOG_WARNING(QStringLiteral("ProxyServer: model list failed: %1")
                                .arg(models.error().message));
                sendFailure(guard, models.error());
                return;
            }

            const QByteArray body = preferAnthropicSchema
                ? MessagesCodec::encodeModelList(*models)
                : ChatCodec::encodeModelList(*models);
            sendHttpResponse(guard, 200, body,
                             QStringLiteral("application/json; charset=utf-8"));
        });
}

// ========================================================================
// Responses
// ========================================================================

void ProxyServer::sendHttpResponse(QTcpSocket* socket, int status,
                                   const QByteArray& body,
                                   const QString& contentType)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    static const QMap<int, QString> statusTexts = {
        {200, QStringLiteral("OK")},
        {204, QStringLiteral("No Content")},
        {400, QStringLiteral("Bad Request")},
        {401, QStringLiteral("Unauthorized")},
        {403, QStringLiteral("Forbidden")},
        {404, QStringLiteral("Not Found")},
        {413, QStringLiteral("Payload Too Large")},
        {429, QStringLiteral("Too Many Requests")},
        {500, QStringLiteral("Internal Server Error")},
        {501, QStringLiteral("Not Implemented")},
        {502, QStringLiteral("Bad Gateway")},
        {503, QStringLiteral("Service Unavailable")},
        {504, QStringLiteral("Gateway Timeout")}
    };

    QString statusText = statusTexts.value(status, QStringLiteral("Unknown"));

    QByteArray response;
    response.append(QStringLiteral("HTTP/1.1 %1 %2\r\n")
                        .arg(status)
                        .arg(statusText)
                        .toUtf8());
    response.append(QStringLiteral("Content-Type: %1\r\n")
                        .arg(contentType)
                        .toUtf8());
    response.append(QStringLiteral("Content-Length: %1\r\n")
                        .arg(body.size())
                        .toUtf8());
    response.append("Access-Control-Allow-Origin: *\r\n");
    response.append("Connection: keep-alive\r\n");
    response.append("\r\n");
    response.append(body);

    socket->write(response);
    socket->flush();
}

void ProxyServer::sendFailure(QTcpSocket* socket, const DomainFailure& failure)
{
    LOG_WARNING(QStringLiteral("ProxyServer: request failed [%1] %2")
                    .arg(failure.code, failure.message));
    sendHttpResponse(socket, failure.httpStatus(), MessagesCodec::encodeFailure(failure));
}

void ProxyServer::sendCorsPreflight(QTcpSocket* socket)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    const QByteArray response =
        "HTTP/1.1 204 No Content\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
        "Access-Control-Allow-Headers: *\r\n"
        "Access-Control-Max-Age: 86400\r\n"
        "Content-Length: 0\r\n"
        "Connection: keep-alive\r\n"
        "\r\n";
    socket->write(response);
    socket->flush();
}

void ProxyServer::sendStreamResponse(QTcpSocket* socket,
                                     PipelineStreamSession* session)
{
    m_activeSessions[socket] = session;

    SseWriter::writeStreamHeader(socket);

    connect(session, &PipelineStreamSession::encodedFrameReady,
            this, [socket](const QByteArray& data) {
                SseWriter::sendChunk(socket, data);
            });

    connect(session, &PipelineStreamSession::error,
            this, [](const DomainFailure& failure) {
                LOG_WARNING(QStringLiteral("ProxyServer: stream failed [%1] %2")
                                .arg(failure.code, failure.message));
            });

    connect(session, &PipelineStreamSession::finished,
            this, [this, socket, session]() {
                SseWriter::sendTerminator(socket);
                if (m_activeSessions.value(socket) == session) {
                    m_activeSessions.remove(socket);
                    session->deleteLater();
                }
            });
}

// ========================================================================
// buildMetadata
// ========================================================================

QMap<QString, QString> ProxyServer::buildMetadata(const HttpRequest& request) const
{
    QMap<QString, QString> meta;
    meta[PipelineMeta::CallerToken] = TokenExtractor::extract(request.headers);
    meta[QStringLiteral("request_path")] = RequestRouter::normalizePath(request.path);
    return meta;
}
