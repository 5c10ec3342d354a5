#include "catalog_cache.h"
#include "naming/model_renamer.h"
#include "core/log_manager.h"
#include <QPromise>
#include <QSet>
#include <algorithm>
#include <memory>

CatalogCache::CatalogCache(Fetcher fetcher,
                           ModelRenamer* renamer,
                           int ttlSecs,
                           Clock clock,
                           QObject* parent)
    : QObject(parent)
    , m_fetcher(std::move(fetcher))
    , m_renamer(renamer)
    , m_ttlSecs(std::max(0, ttlSecs))
    , m_clock(clock ? std::move(clock) : Clock(systemNow))
{
}

QFuture<Result<ModelList>> CatalogCache::getModels(const QString& callerToken)
{
    {
        QReadLocker locker(&m_lock);
        if (m_entry && m_ttlSecs > 0
            && m_clock() < m_entry->fetchedAt.addSecs(m_ttlSecs))
            return makeReadyResult<ModelList>(m_entry->value);
    }

    std::shared_ptr<QPromise<Result<ModelList>>> promise;
    QFuture<Result<ModelList>> future;
    {
        QMutexLocker flightLocker(&m_flightMutex);
        if (m_inFlight && !m_inFlight->isFinished()) {
            LOG_DEBUG(QStringLiteral("CatalogCache: joining in-flight fetch"));
            return *m_inFlight;
        }

        if (!m_fetcher)
            return makeReadyResult<ModelList>(
                std::unexpected(DomainFailure::internal(QStringLiteral("no model fetcher"))));

        ++m_fetchCount;
        LOG_DEBUG(QStringLiteral("CatalogCache: fetching model list (fetch #%1)").arg(m_fetchCount));

        promise = std::make_shared<QPromise<Result<ModelList>>>();
        future = promise->future();
        promise->start();
        m_inFlight = future;
    }

    // The fetcher may block in a nested event loop that re-enters getModels(),
    // so it runs with the flight lock released.
    m_fetcher(callerToken).then(this, [this, promise](Result<ModelList> result) {
        promise->addResult(complete(std::move(result)));
        promise->finish();
    });
    return future;
}

Result<ModelList> CatalogCache::complete(Result<ModelList> result)
{
    if (!result) {
        LOG_WARNING(QStringLiteral("CatalogCache: fetch failed, keeping previous entry: %1")
                        .arg(result.error().message));
        return result;
    }

    ModelList models;
    QSet<QString> seenClientIds;
    for (ModelInfo model : *result) {
        model.clientId = m_renamer ? m_renamer->learn(model.backendId) : model.backendId;
        // Backend variants collapsing onto one client id are listed once.
        if (seenClientIds.contains(model.clientId))
            continue;
        seenClientIds.insert(model.clientId);
        models.append(model);
    }

    {
        QWriteLocker locker(&m_lock);
        m_entry = CacheEntry{models, m_clock()};
    }

    LOG_INFO(QStringLiteral("CatalogCache: cached %1 models").arg(models.size()));
    emit modelsUpdated(models.size());
    return models;
}

std::optional<ModelList> CatalogCache::cached() const
{
    QReadLocker locker(&m_lock);
    if (!m_entry)
        return std::nullopt;
    return m_entry->value;
}

QDateTime CatalogCache::fetchedAt() const
{
    QReadLocker locker(&m_lock);
    return m_entry ? m_entry->fetchedAt : QDateTime();
}

int CatalogCache::fetchCount() const
{
    QMutexLocker locker(&m_flightMutex);
    return m_fetchCount;
}

bool CatalogCache::isFetchInFlight() const
{
    QMutexLocker locker(&m_flightMutex);
    return m_inFlight && !m_inFlight->isFinished();
}

void CatalogCache::invalidate()
{
    QWriteLocker locker(&m_lock);
    m_entry.reset();
}
