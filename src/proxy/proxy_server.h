#pragma once
#include "request_router.h"
#include "semantic/failure.h"
#include <QHostAddress>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QMap>

class Pipeline;
class PipelineStreamSession;

class ProxyServer : public QObject {
    Q_OBJECT
public:
    explicit ProxyServer(QObject* parent = nullptr);
    ~ProxyServer() override;

    // Port 0 picks a free port; see serverPort().
    bool start(quint16 port, const QHostAddress& address = QHostAddress::Any);
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;
    void setPipeline(Pipeline* pipeline);
    int activeStreamCount() const { return m_activeSessions.size(); }
    // Requests announcing a larger Content-Length are rejected with 413.
    void setMaxBodyBytes(qint64 bytes) { m_maxBodyBytes = bytes; }
    qint64 maxBodyBytes() const { return m_maxBodyBytes; }

signals:
    void statusChanged(bool running);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    struct HttpRequest {
        QString method, path, httpVersion;
        QMap<QString, QString> headers;
        QByteArray body;
        bool complete = false;
        int contentLength = 0;
    };

    HttpRequest parseHttpRequest(const QByteArray& data);
    void handleRequest(QTcpSocket* socket, const HttpRequest& request);
    void handleMessages(QTcpSocket* socket, const HttpRequest& request);
    void handleChatCompletions(QTcpSocket* socket, const HttpRequest& request);
    void handleModelsRequest(QTcpSocket* socket, const HttpRequest& request);
    void sendHttpResponse(QTcpSocket* socket, int status,
                          const QByteArray& body,
                          const QString& contentType = QStringLiteral("application/json"));
    void sendFailure(QTcpSocket* socket, const DomainFailure& failure);
    void sendCorsPreflight(QTcpSocket* socket);
    void sendStreamResponse(QTcpSocket* socket, PipelineStreamSession* session);
    QMap<QString, QString> buildMetadata(const HttpRequest& request) const;

    QTcpServer* m_server = nullptr;
    RequestRouter m_router;
    Pipeline* m_pipeline = nullptr;
    QMap<QTcpSocket*, QByteArray> m_pendingData;
    QMap<QTcpSocket*, PipelineStreamSession*> m_activeSessions;
    qint64 m_maxBodyBytes = 32 * 1024 * 1024;
};
