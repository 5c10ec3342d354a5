#pragma once
#include "semantic/ports.h"
#include <QNetworkAccessManager>

class QtExecutor : public IExecutor {
public:
    QtExecutor();

    Result<ProviderResponse> execute(const ProviderRequest& request) override;
    QFuture<Result<ProviderResponse>> executeAsync(const ProviderRequest& request) override;
    Result<QNetworkReply*> connectStream(const ProviderRequest& request) override;

    void setRequestTimeout(int ms) { m_requestTimeout = ms; }
    void setConnectionTimeout(int ms) { m_connectionTimeout = ms; }
    int requestTimeout() const { return m_requestTimeout; }
    int connectionTimeout() const { return m_connectionTimeout; }

private:
    QNetworkAccessManager m_nam;
    int m_requestTimeout = 120000;
    int m_connectionTimeout = 30000;

    QNetworkRequest buildQtRequest(const ProviderRequest& request) const;
    QNetworkReply* send(const ProviderRequest& request);
    static std::optional<DomainFailure> checkConnectionError(QNetworkReply* reply);
    static ProviderResponse collectResponse(QNetworkReply* reply);
};
