#include "stream_session.h"
#include "adapters/outbound/chat_codec.h"
#include "core/log_manager.h"

StreamSession::StreamSession(QNetworkReply* reply, QObject* parent)
    : QObject(parent)
    , m_reply(reply)
{
    if (!m_reply)
        return;

    // The session owns the reply from here on.
    m_reply->setParent(this);

    connect(m_reply, &QNetworkReply::readyRead,
            this, &StreamSession::onReadyRead);
    connect(m_reply, &QNetworkReply::finished,
            this, &StreamSession::onReplyFinished);
    connect(m_reply, &QNetworkReply::errorOccurred,
            this, &StreamSession::onReplyError);

    // A reply that completed before the connections were made never emits
    // finished() again; otherwise pick up the bytes read by connectStream().
    if (m_reply->isFinished())
        QMetaObject::invokeMethod(this, &StreamSession::onReplyFinished, Qt::QueuedConnection);
    else if (m_reply->bytesAvailable() > 0)
        QMetaObject::invokeMethod(this, &StreamSession::onReadyRead, Qt::QueuedConnection);
}

StreamSession::~StreamSession()
{
    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
        m_reply = nullptr;
    }
}

void StreamSession::abort()
{
    if (m_finished) return;
    m_finished = true;
    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
    }
}

void StreamSession::feed(const QByteArray& bytes)
{
    if (m_finished) return;
    dispatch(m_parser.push(bytes));
}

void StreamSession::onReadyRead()
{
    if (!m_reply || m_finished) return;
    dispatch(m_parser.push(m_reply->readAll()));
}

void StreamSession::onReplyFinished()
{
    if (m_finished) return;

    if (m_reply && m_reply->error() != QNetworkReply::NoError) {
        onReplyError(m_reply->error());
        return;
    }

    if (m_reply && m_reply->bytesAvailable() > 0)
        dispatch(m_parser.push(m_reply->readAll()));
    if (m_finished) return;

    dispatch(m_parser.flush());
    if (m_finished) return;

    m_finished = true;
    emit finished();
}

void StreamSession::onReplyError(QNetworkReply::NetworkError code)
{
    if (m_finished || code == QNetworkReply::NoError) return;

    DomainFailure failure;
    const int httpStatus = m_reply
        ? m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt() : 0;

    if (httpStatus >= 300) {
        failure = ChatCodec::mapFailure(httpStatus, m_reply->readAll());
    } else {
        failure = DomainFailure::streamAborted(
            QStringLiteral("Backend stream interrupted: %1").arg(
                m_reply ? m_reply->errorString() : QStringLiteral("unknown")));
    }

    LOG_ERROR(QStringLiteral("StreamSession error [%1]: %2")
                  .arg(failure.code, failure.message));

    m_finished = true;
    emit error(failure);
}

void StreamSession::dispatch(const QList<SseEvent>& events)
{
    for (const SseEvent& event : events) {
        if (m_finished) return;

        if (event.data.trimmed() == "[DONE]") {
            m_finished = true;
            emit finished();
            return;
        }

        if (event.data.trimmed().isEmpty())
            continue;

        emit dataReady(event.data);
    }
}
