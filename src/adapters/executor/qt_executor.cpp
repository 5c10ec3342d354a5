#include "qt_executor.h"
#include "adapters/outbound/chat_codec.h"
#include "core/log_manager.h"
#include <QEventLoop>
#include <QPromise>
#include <QTimer>
#include <QNetworkReply>
#include <QUrl>
#include <memory>

QtExecutor::QtExecutor() = default;

QNetworkRequest QtExecutor::buildQtRequest(const ProviderRequest& request) const {
    QNetworkRequest req{QUrl{request.url}};

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!request.body.isEmpty() && !req.hasRawHeader("Content-Type")
        && !req.hasRawHeader("content-type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    req.setTransferTimeout(m_requestTimeout);
    return req;
}

QNetworkReply* QtExecutor::send(const ProviderRequest& request) {
    QNetworkRequest req = buildQtRequest(request);

    const QString method = request.method.trimmed().toUpper();
    if (method == "POST")
        return m_nam.post(req, request.body);
    if (method == "GET" || method.isEmpty())
        return m_nam.get(req);
    if (method == "PUT")
        return m_nam.put(req, request.body);
    if (method == "DELETE")
        return m_nam.deleteResource(req);
    return m_nam.sendCustomRequest(req, method.toUtf8(), request.body);
}

// An HTTP status means the backend answered; that is a response, not a failure.
std::optional<DomainFailure> QtExecutor::checkConnectionError(QNetworkReply* reply) {
    if (!reply) return DomainFailure::internal("null reply");
    if (reply->error() == QNetworkReply::NoError) return std::nullopt;

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status > 0)
        return std::nullopt;

    if (reply->error() == QNetworkReply::TimeoutError
        || reply->error() == QNetworkReply::OperationCanceledError)
        return DomainFailure::timeout(reply->errorString());
    return DomainFailure::unavailable(reply->errorString());
}

ProviderResponse QtExecutor::collectResponse(QNetworkReply* reply) {
    ProviderResponse resp;
    resp.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    resp.body = reply->readAll();
    for (const auto& header : reply->rawHeaderList())
        resp.headers[QString::fromUtf8(header).toLower()] = QString::fromUtf8(reply->rawHeader(header));
    return resp;
}

Result<ProviderResponse> QtExecutor::execute(const ProviderRequest& request) {
    QNetworkReply* reply = send(request);

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeoutTimer.start(m_requestTimeout);
    loop.exec();

    if (reply->isRunning()) {
        reply->abort();
        reply->deleteLater();
        LOG_WARNING(QStringLiteral("QtExecutor: request timeout %1").arg(request.url));
        return std::unexpected(DomainFailure::timeout("request timeout"));
    }

    auto err = checkConnectionError(reply);
    if (err) {
        reply->deleteLater();
        LOG_WARNING(QStringLiteral("QtExecutor: %1 failed: %2").arg(request.url, err->message));
        return std::unexpected(*err);
    }

    ProviderResponse resp = collectResponse(reply);
    reply->deleteLater();
    return resp;
}

QFuture<Result<ProviderResponse>> QtExecutor::executeAsync(const ProviderRequest& request) {
    auto promise = std::make_shared<QPromise<Result<ProviderResponse>>>();
    QFuture<Result<ProviderResponse>> future = promise->future();
    promise->start();

    QNetworkReply* reply = send(request);
    const QString url = request.url;

    auto* timeoutTimer = new QTimer(reply);
    timeoutTimer->setSingleShot(true);
    QObject::connect(timeoutTimer, &QTimer::timeout, reply, [reply, url]() {
        LOG_WARNING(QStringLiteral("QtExecutor: async request timeout %1").arg(url));
        reply->abort();
    });
    timeoutTimer->start(m_requestTimeout);

    QObject::connect(reply, &QNetworkReply::finished, reply, [reply, promise, timeoutTimer]() {
        timeoutTimer->stop();
        if (auto err = checkConnectionError(reply)) {
            promise->addResult(Result<ProviderResponse>(std::unexpected(*err)));
        } else {
            promise->addResult(Result<ProviderResponse>(collectResponse(reply)));
        }
        promise->finish();
        reply->deleteLater();
    });

    return future;
}

Result<QNetworkReply*> QtExecutor::connectStream(const ProviderRequest& request) {
    QNetworkReply* reply = send(request);

    QEventLoop loop;
    bool gotData = false;
    bool gotError = false;

    QObject::connect(reply, &QNetworkReply::readyRead, &loop, [&]() {
        gotData = true;
        loop.quit();
    });
    QObject::connect(reply, &QNetworkReply::errorOccurred, &loop, [&]() {
        gotError = true;
        loop.quit();
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeoutTimer.start(m_connectionTimeout);
    loop.exec();

    if (!gotData && !gotError && reply->isRunning()) {
        reply->abort();
        reply->deleteLater();
        return std::unexpected(DomainFailure::timeout("connection timeout"));
    }

    if (auto err = checkConnectionError(reply)) {
        reply->abort();
        reply->deleteLater();
        return std::unexpected(*err);
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 300) {
        // Drain the error body before mapping it.
        if (reply->isRunning()) {
            QEventLoop drain;
            QObject::connect(reply, &QNetworkReply::finished, &drain, &QEventLoop::quit);
            QTimer drainTimer;
            drainTimer.setSingleShot(true);
            QObject::connect(&drainTimer, &QTimer::timeout, &drain, &QEventLoop::quit);
            drainTimer.start(m_connectionTimeout);
            drain.exec();
        }
        const QByteArray body = reply->readAll();
        reply->abort();
        reply->deleteLater();
        LOG_WARNING(QStringLiteral("QtExecutor: stream rejected with HTTP %1").arg(status));
        return std::unexpected(ChatCodec::mapFailure(status, body));
    }

    return reply;
}
