#pragma once
#include "auth/credential.h"
#include "adapters/outbound/copilot_api.h"
#include "core/clock.h"
#include "semantic/ports.h"
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QReadWriteLock>
#include <QTimer>
#include <optional>

// Owns the short-lived backend credential. An operator token, when
// configured, always wins and is refreshed in the background; otherwise
// caller tokens are exchanged on demand and cached per token.
class CredentialManager : public QObject {
    Q_OBJECT
public:
    static constexpr int kCallerReuseBufferSecs = 120;
    static constexpr int kMaxBackoffSecs = 30;
    static constexpr int kEvictIntervalMs = 5 * 60 * 1000;

    CredentialManager(IExecutor* executor,
                      const CopilotApi* api,
                      const QString& operatorToken = {},
                      int refreshMarginSecs = 60,
                      Clock clock = systemNow,
                      QObject* parent = nullptr);
    ~CredentialManager() override;

    Result<Credential> acquire(const QString& callerToken = {});
    Result<Credential> current() const;
    // Credential for one request: operator credential if configured,
    // otherwise the cached or freshly exchanged caller credential.
    Result<Credential> resolve(const QString& callerToken);

    bool hasOperatorToken() const { return !m_operatorToken.isEmpty(); }
    int refreshMarginSecs() const { return m_refreshMarginSecs; }
    QDateTime nextRefreshAt() const;
    int failedRefreshAttempts() const;
    int cachedCallerCount() const;
    void evictExpired();

public slots:
    void refresh();

signals:
    void credentialRefreshed(const QDateTime& expiresAt);
    void refreshFailed(const DomainFailure& failure);

private:
    IExecutor* m_executor;
    const CopilotApi* m_api;
    QString m_operatorToken;
    int m_refreshMarginSecs;
    Clock m_clock;

    mutable QReadWriteLock m_lock;
    std::optional<Credential> m_current;
    QDateTime m_nextRefreshAt;
    int m_failedAttempts = 0;

    mutable QMutex m_cacheMutex;
    QHash<QString, Credential> m_callerCache;

    QTimer m_refreshTimer;
    QTimer m_evictTimer;

    Result<Credential> exchange(const QString& longLivedToken);
    void store(const Credential& credential);
    void scheduleRefreshAt(const QDateTime& when);
    static QString tokenHint(const QString& token);
};
