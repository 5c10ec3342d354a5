#include "credential_manager.h"
#include "core/log_manager.h"
#include <algorithm>
#include <climits>

CredentialManager::CredentialManager(IExecutor* executor,
                                     const CopilotApi* api,
                                     const QString& operatorToken,
                                     int refreshMarginSecs,
                                     Clock clock,
                                     QObject* parent)
    : QObject(parent)
    , m_executor(executor)
    , m_api(api)
    , m_operatorToken(operatorToken.trimmed())
    , m_refreshMarginSecs(std::max(0, refreshMarginSecs))
    , m_clock(clock ? std::move(clock) : Clock(systemNow))
{
    m_refreshTimer.setSingleShot(true);
    connect(&m_refreshTimer, &QTimer::timeout, this, &CredentialManager::refresh);

    m_evictTimer.setInterval(kEvictIntervalMs);
    connect(&m_evictTimer, &QTimer::timeout, this, &CredentialManager::evictExpired);
    m_evictTimer.start();
}

CredentialManager::~CredentialManager()
{
    m_refreshTimer.stop();
    m_evictTimer.stop();
}

QString CredentialManager::tokenHint(const QString& token)
{
    return token.left(4) + QStringLiteral("...") + token.right(4);
}

Result<Credential> CredentialManager::exchange(const QString& longLivedToken)
{
    if (!m_executor || !m_api)
        return std::unexpected(DomainFailure::internal(QStringLiteral("credential transport not configured")));

    auto response = m_executor->execute(m_api->tokenExchangeRequest(longLivedToken));
    if (!response) {
        LOG_WARNING(QStringLiteral("CredentialManager: exchange transport error for %1: %2")
                        .arg(tokenHint(longLivedToken), response.error().message));
        DomainFailure failure = DomainFailure::exchangeFailed(response.error().message);
        failure.temporary = true;
        failure.retryable = true;
        return std::unexpected(failure);
    }

    if (!response->isSuccess()) {
        LOG_WARNING(QStringLiteral("CredentialManager: exchange rejected for %1 (HTTP %2)")
                        .arg(tokenHint(longLivedToken))
                        .arg(response->statusCode));
        DomainFailure failure = DomainFailure::exchangeFailed(
            QStringLiteral("Token exchange failed with HTTP %1").arg(response->statusCode));
        failure.upstreamStatus = response->statusCode;
        failure.temporary = response->statusCode == 429 || response->statusCode >= 500;
        failure.retryable = failure.temporary;
        return std::unexpected(failure);
    }

    return CopilotApi::parseTokenResponse(response->body, m_clock());
}

void CredentialManager::store(const Credential& credential)
{
    QWriteLocker locker(&m_lock);
    m_current = credential;
    m_failedAttempts = 0;
}

Result<Credential> CredentialManager::acquire(const QString& callerToken)
{
    const bool operatorPath = hasOperatorToken();
    const QString longLived = operatorPath ? m_operatorToken : callerToken.trimmed();
    if (longLived.isEmpty())
        return std::unexpected(DomainFailure::missingToken());

    auto credential = exchange(longLived);
    if (!credential)
        return std::unexpected(credential.error());

    LOG_INFO(QStringLiteral("CredentialManager: acquired credential (%1), expires %2")
                 .arg(operatorPath ? QStringLiteral("operator") : QStringLiteral("caller"),
                      credential->expiresAt.toString(Qt::ISODate)));

    if (operatorPath) {
        store(*credential);
        scheduleRefreshAt(credential->expiresAt.addSecs(-m_refreshMarginSecs));
    } else {
        QMutexLocker locker(&m_cacheMutex);
        m_callerCache.insert(longLived, *credential);
    }
    return credential;
}

Result<Credential> CredentialManager::current() const
{
    QReadLocker locker(&m_lock);
    if (!m_current)
        return std::unexpected(DomainFailure::missingToken());
    if (!m_current->isValidAt(m_clock()))
        return std::unexpected(DomainFailure::expired());
    return *m_current;
}

Result<Credential> CredentialManager::resolve(const QString& callerToken)
{
    if (hasOperatorToken()) {
        bool held = false;
        {
            QReadLocker locker(&m_lock);
            held = m_current.has_value();
        }
        // Once held, the operator credential is only replaced by refresh();
        // an expired one fails requests until a refresh succeeds.
        if (held)
            return current();
        return acquire();
    }

    const QString token = callerToken.trimmed();
    if (token.isEmpty())
        return std::unexpected(DomainFailure::missingToken());

    {
        QMutexLocker locker(&m_cacheMutex);
        auto it = m_callerCache.constFind(token);
        if (it != m_callerCache.constEnd()
            && m_clock().addSecs(kCallerReuseBufferSecs) < it->expiresAt)
            return *it;
    }
    return acquire(token);
}

void CredentialManager::refresh()
{
    if (!hasOperatorToken())
        return;

    auto credential = exchange(m_operatorToken);
    if (credential) {
        store(*credential);
        LOG_INFO(QStringLiteral("CredentialManager: credential refreshed, expires %1")
                     .arg(credential->expiresAt.toString(Qt::ISODate)));
        scheduleRefreshAt(credential->expiresAt.addSecs(-m_refreshMarginSecs));
        emit credentialRefreshed(credential->expiresAt);
        return;
    }

    QDateTime expiresAt;
    int attempts = 0;
    {
        QWriteLocker locker(&m_lock);
        attempts = ++m_failedAttempts;
        if (m_current)
            expiresAt = m_current->expiresAt;
    }

    const int backoffSecs = std::min(kMaxBackoffSecs, 1 << std::min(attempts - 1, 5));
    const QDateTime now = m_clock();
    QDateTime retryAt = now.addSecs(backoffSecs);

    if (expiresAt.isValid() && now < expiresAt) {
        if (retryAt > expiresAt)
            retryAt = expiresAt;
        LOG_WARNING(QStringLiteral("CredentialManager: refresh failed (attempt %1): %2; retrying in %3s")
                        .arg(attempts)
                        .arg(credential.error().message)
                        .arg(now.secsTo(retryAt)));
    } else {
        LOG_ERROR(QStringLiteral("CredentialManager: refresh failed (attempt %1): %2; credential expired, retrying in %3s")
                      .arg(attempts)
                      .arg(credential.error().message)
                      .arg(backoffSecs));
    }
    scheduleRefreshAt(retryAt);
    emit refreshFailed(credential.error());
}

void CredentialManager::scheduleRefreshAt(const QDateTime& when)
{
    const QDateTime now = m_clock();
    const QDateTime at = when < now.addSecs(1) ? now.addSecs(1) : when;
    {
        QWriteLocker locker(&m_lock);
        m_nextRefreshAt = at;
    }
    m_refreshTimer.start(static_cast<int>(std::min<qint64>(now.msecsTo(at), INT_MAX)));
    LOG_DEBUG(QStringLiteral("CredentialManager: next refresh at %1").arg(at.toString(Qt::ISODate)));
}

QDateTime CredentialManager::nextRefreshAt() const
{
    QReadLocker locker(&m_lock);
    return m_nextRefreshAt;
}

int CredentialManager::failedRefreshAttempts() const
{
    QReadLocker locker(&m_lock);
    return m_failedAttempts;
}

int CredentialManager::cachedCallerCount() const
{
    QMutexLocker locker(&m_cacheMutex);
    return m_callerCache.size();
}

void CredentialManager::evictExpired()
{
    const QDateTime now = m_clock();
    QMutexLocker locker(&m_cacheMutex);
    for (auto it = m_callerCache.begin(); it != m_callerCache.end();) {
        if (!it->isValidAt(now))
            it = m_callerCache.erase(it);
        else
            ++it;
    }
}
