#pragma once
#include "ports.h"
#include "sse_parser.h"
#include <QObject>
#include <QNetworkReply>

// Reads a backend SSE stream and hands each data payload upward.
// "[DONE]" and the end of the reply both emit finished().
class StreamSession : public QObject {
    Q_OBJECT
public:
    explicit StreamSession(QNetworkReply* reply, QObject* parent = nullptr);
    ~StreamSession() override;

    void abort();
    bool isFinished() const { return m_finished; }

    // Feeds bytes as if they came from the reply.
    void feed(const QByteArray& bytes);

signals:
    void dataReady(const QByteArray& data);
    void finished();
    void error(const DomainFailure& failure);

private slots:
    void onReadyRead();
    void onReplyFinished();
    void onReplyError(QNetworkReply::NetworkError code);

private:
    QNetworkReply* m_reply;
    SseParser m_parser;
    bool m_finished = false;

    void dispatch(const QList<SseEvent>& events);
};
