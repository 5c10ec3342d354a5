#pragma once
#include "failure.h"
#include <expected>
#include <QByteArray>
#include <QFuture>
#include <QMap>
#include <QNetworkReply>
#include <QPromise>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

template<typename T>
QFuture<Result<T>> makeReadyResult(const Result<T>& value)
{
    QPromise<Result<T>> promise;
    QFuture<Result<T>> future = promise.future();
    promise.start();
    promise.addResult(value);
    promise.finish();
    return future;
}

struct ProviderRequest {
    QString method;
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    bool stream = false;
};

struct ProviderResponse {
    int statusCode = 0;
    QMap<QString, QString> headers;
    QByteArray body;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
};

// Transport to the backend. HTTP error statuses come back as responses;
// only connection-level problems are failures.
class IExecutor {
public:
    virtual ~IExecutor() = default;
    virtual Result<ProviderResponse> execute(
        const ProviderRequest& request) = 0;
    virtual QFuture<Result<ProviderResponse>> executeAsync(
        const ProviderRequest& request) = 0;
    virtual Result<QNetworkReply*> connectStream(
        const ProviderRequest& request) = 0;
};
