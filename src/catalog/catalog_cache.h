#pragma once
#include "catalog/model_info.h"
#include "core/clock.h"
#include "semantic/ports.h"
#include <QFuture>
#include <QMutex>
#include <QObject>
#include <QReadWriteLock>
#include <functional>
#include <optional>

class ModelRenamer;

// TTL cache over the backend model list with single-flight fetching:
// callers arriving while a fetch is pending share its future.
class CatalogCache : public QObject {
    Q_OBJECT
public:
    using Fetcher = std::function<QFuture<Result<ModelList>>(const QString& callerToken)>;

    CatalogCache(Fetcher fetcher,
                 ModelRenamer* renamer,
                 int ttlSecs = 300,
                 Clock clock = systemNow,
                 QObject* parent = nullptr);

    QFuture<Result<ModelList>> getModels(const QString& callerToken = {});

    std::optional<ModelList> cached() const;
    QDateTime fetchedAt() const;
    int ttlSecs() const { return m_ttlSecs; }
    int fetchCount() const;
    bool isFetchInFlight() const;
    void invalidate();

signals:
    void modelsUpdated(int count);

private:
    struct CacheEntry {
        ModelList value;
        QDateTime fetchedAt;
    };

    Fetcher m_fetcher;
    ModelRenamer* m_renamer;
    int m_ttlSecs;
    Clock m_clock;

    mutable QReadWriteLock m_lock;
    std::optional<CacheEntry> m_entry;

    mutable QMutex m_flightMutex;
    std::optional<QFuture<Result<ModelList>>> m_inFlight;
    int m_fetchCount = 0;

    Result<ModelList> complete(Result<ModelList> result);
};
