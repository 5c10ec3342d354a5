#include <QTest>
#include <QSignalSpy>
#include <QPromise>
#include "catalog/catalog_cache.h"
#include "naming/model_renamer.h"
#include <memory>

class TestCatalogCache : public QObject {
    Q_OBJECT

private:
    using ModelPromise = QPromise<Result<ModelList>>;

    QDateTime m_now;
    QList<std::shared_ptr<ModelPromise>> m_pending;
    QStringList m_callerTokens;

    Clock fixedClock() {
        return [this]() { return m_now; };
    }

    CatalogCache::Fetcher controlledFetcher() {
        return [this](const QString& callerToken) {
            auto promise = std::make_shared<ModelPromise>();
            promise->start();
            m_pending.append(promise);
            m_callerTokens.append(callerToken);
            return promise->future();
        };
    }

    static ModelList backendModels() {
        ModelList models;
        models.append(ModelInfo{QStringLiteral("claude-sonnet-4.5"), QStringLiteral("claude-sonnet-4.5"),
                                QStringLiteral("Claude Sonnet 4.5"), QStringLiteral("Anthropic"), 0});
        models.append(ModelInfo{QStringLiteral("claude-sonnet-4-5"), QStringLiteral("claude-sonnet-4-5"),
                                QString(), QStringLiteral("Anthropic"), 0});
        models.append(ModelInfo{QStringLiteral("gpt-4o"), QStringLiteral("gpt-4o"),
                                QStringLiteral("GPT-4o"), QStringLiteral("Azure OpenAI"), 0});
        return models;
    }

    void resolveNext(const Result<ModelList>& result) {
        auto promise = m_pending.takeFirst();
        promise->addResult(result);
        promise->finish();
    }

private slots:
    void init() {
        m_now = QDateTime::fromSecsSinceEpoch(1760000000, Qt::UTC);
        m_pending.clear();
        m_callerTokens.clear();
    }

    void cleanup() {
        for (const auto& promise : std::as_const(m_pending))
            promise->finish();
        m_pending.clear();
    }

    void testConcurrentCallersShareOneFetch() {
        ModelRenamer renamer;
        CatalogCache cache(controlledFetcher(), &renamer, 300, fixedClock());
        QSignalSpy updated(&cache, &CatalogCache::modelsUpdated);

        QFuture<Result<ModelList>> first = cache.getModels(QStringLiteral("ghp_a"));
        QFuture<Result<ModelList>> second = cache.getModels(QStringLiteral("ghp_b"));
        QCOMPARE(cache.fetchCount(), 1);
        QVERIFY(cache.isFetchInFlight());
        QCOMPARE(m_callerTokens, QStringList{QStringLiteral("ghp_a")});

        resolveNext(backendModels());
        QTRY_VERIFY(first.isFinished());
        QTRY_VERIFY(second.isFinished());

        const Result<ModelList> a = first.result();
        const Result<ModelList> b = second.result();
        QVERIFY(a.has_value());
        QVERIFY(b.has_value());
        QCOMPARE(a->size(), 2);
        QCOMPARE(b->size(), 2);
        QCOMPARE(updated.count(), 1);
        QVERIFY(!cache.isFetchInFlight());
    }

    void testFetcherReentryJoinsInFlightFetch() {
        ModelRenamer renamer;
        CatalogCache* cachePtr = nullptr;
        QFuture<Result<ModelList>> nested;
        int fetcherCalls = 0;

        CatalogCache::Fetcher inner = controlledFetcher();
        CatalogCache cache([&](const QString& callerToken) {
            ++fetcherCalls;
            // A second request served from a nested event loop during the fetch.
            nested = cachePtr->getModels(QStringLiteral("ghp_nested"));
            return inner(callerToken);
        }, &renamer, 300, fixedClock());
        cachePtr = &cache;

        QFuture<Result<ModelList>> outer = cache.getModels(QStringLiteral("ghp_outer"));
        QCOMPARE(fetcherCalls, 1);
        QCOMPARE(cache.fetchCount(), 1);
        QVERIFY(cache.isFetchInFlight());
        QVERIFY(!nested.isFinished());

        resolveNext(backendModels());
        QTRY_VERIFY(outer.isFinished());
        QTRY_VERIFY(nested.isFinished());
        QCOMPARE(outer.result()->size(), 2);
        QCOMPARE(nested.result()->size(), 2);
        QCOMPARE(m_callerTokens, QStringList{QStringLiteral("ghp_outer")});
    }

    void testRenamesAndCollapsesVariants() {
        ModelRenamer renamer;
        CatalogCache cache(controlledFetcher(), &renamer, 300, fixedClock());

        QFuture<Result<ModelList>> future = cache.getModels();
        resolveNext(backendModels());
        QTRY_VERIFY(future.isFinished());

        const ModelList models = *future.result();
        QCOMPARE(models[0].clientId, QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(models[0].backendId, QStringLiteral("claude-sonnet-4.5"));
        QCOMPARE(models[0].displayName, QStringLiteral("Claude Sonnet 4.5"));
        QCOMPARE(models[1].clientId, QStringLiteral("gpt-4o"));

        // The exact-match backend id is preferred when mapping back.
        QCOMPARE(renamer.toBackend(QStringLiteral("claude-sonnet-4-5")), QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(renamer.toBackend(QStringLiteral("gpt-4o")), QStringLiteral("gpt-4o"));
    }

    void testTtlHitAndExpiry() {
        CatalogCache cache(controlledFetcher(), nullptr, 300, fixedClock());

        QFuture<Result<ModelList>> initial = cache.getModels();
        resolveNext(backendModels());
        QTRY_VERIFY(initial.isFinished());
        QCOMPARE(cache.fetchedAt(), m_now);

        m_now = m_now.addSecs(299);
        QFuture<Result<ModelList>> hit = cache.getModels();
        QVERIFY(hit.isFinished());
        QCOMPARE(hit.result()->size(), 3);
        QCOMPARE(cache.fetchCount(), 1);

        m_now = m_now.addSecs(1);
        QFuture<Result<ModelList>> refetch = cache.getModels();
        QCOMPARE(cache.fetchCount(), 2);
        resolveNext(ModelList{});
        QTRY_VERIFY(refetch.isFinished());
        QVERIFY(refetch.result()->isEmpty());
        QVERIFY(cache.cached()->isEmpty());
    }

    void testZeroTtlAlwaysFetches() {
        CatalogCache cache(controlledFetcher(), nullptr, 0, fixedClock());

        QFuture<Result<ModelList>> first = cache.getModels();
        resolveNext(backendModels());
        QTRY_VERIFY(first.isFinished());

        QFuture<Result<ModelList>> second = cache.getModels();
        QCOMPARE(cache.fetchCount(), 2);
        resolveNext(backendModels());
        QTRY_VERIFY(second.isFinished());
    }

    void testFailureKeepsPreviousEntry() {
        CatalogCache cache(controlledFetcher(), nullptr, 60, fixedClock());

        QFuture<Result<ModelList>> first = cache.getModels();
        resolveNext(backendModels());
        QTRY_VERIFY(first.isFinished());

        m_now = m_now.addSecs(61);
        QFuture<Result<ModelList>> failed = cache.getModels();
        resolveNext(std::unexpected(DomainFailure::upstream(503, QStringLiteral("busy"))));
        QTRY_VERIFY(failed.isFinished());

        const Result<ModelList> result = failed.result();
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 503);
        QVERIFY(cache.cached().has_value());
        QCOMPARE(cache.cached()->size(), 3);
    }

    void testInvalidate() {
        CatalogCache cache(controlledFetcher(), nullptr, 300, fixedClock());
        QFuture<Result<ModelList>> first = cache.getModels();
        resolveNext(backendModels());
        QTRY_VERIFY(first.isFinished());

        cache.invalidate();
        QVERIFY(!cache.cached().has_value());
        cache.getModels();
        QCOMPARE(cache.fetchCount(), 2);
    }
};

QTEST_MAIN(TestCatalogCache)
#include "tst_catalog_cache.moc"
