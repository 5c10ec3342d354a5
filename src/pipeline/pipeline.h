#pragma once
#include "catalog/catalog_cache.h"
#include "semantic/ports.h"
#include "translate/request_translator.h"
#include "translate/response_translator.h"
#include <QObject>
#include <memory>

class CopilotApi;
class CredentialManager;
class ModelRenamer;
class StreamSession;
class StreamTranslator;

// Metadata keys handed over by the HTTP layer.
namespace PipelineMeta {
inline const QString CallerToken = QStringLiteral("caller_token");
}

// Turns one upstream SSE stream into encoded frames for the caller.
// With a translator the frames are client-protocol events; without one the
// backend's data payloads are relayed unchanged.
class PipelineStreamSession : public QObject {
    Q_OBJECT
public:
    PipelineStreamSession(StreamSession* upstream,
                          std::unique_ptr<StreamTranslator> translator,
                          QObject* parent = nullptr);
    ~PipelineStreamSession() override;

    void abort();
    bool isTranslating() const { return m_translator != nullptr; }

signals:
    void encodedFrameReady(const QByteArray& sseData);
    void finished();
    void error(const DomainFailure& failure);

private slots:
    void onUpstreamData(const QByteArray& data);
    void onUpstreamFinished();
    void onUpstreamError(const DomainFailure& failure);

private:
    StreamSession* m_upstream;
    std::unique_ptr<StreamTranslator> m_translator;
    bool m_done = false;

    void emitEvents(const QList<StreamEvent>& events);
};

class Pipeline : public QObject {
    Q_OBJECT
public:
    Pipeline(IExecutor* executor,
             CredentialManager* credentials,
             CatalogCache* catalog,
             ModelRenamer* renamer,
             const CopilotApi* api,
             RequestTranslatorOptions options = {},
             QObject* parent = nullptr);

    // Client-protocol request in, client-protocol response body out.
    Result<QByteArray> process(const QByteArray& requestBody,
                               const QMap<QString, QString>& metadata);

    Result<PipelineStreamSession*> processStream(
        const QByteArray& requestBody,
        const QMap<QString, QString>& metadata);

    // Backend-protocol request relayed with its model resolved.
    Result<ProviderResponse> passthrough(const QByteArray& requestBody,
                                         const QMap<QString, QString>& metadata);

    Result<PipelineStreamSession*> passthroughStream(
        const QByteArray& requestBody,
        const QMap<QString, QString>& metadata);

    QFuture<Result<ModelList>> listModels(const QMap<QString, QString>& metadata);

    static bool isStreamRequest(const QByteArray& requestBody);
    static CatalogCache::Fetcher makeModelFetcher(IExecutor* executor,
                                                  CredentialManager* credentials,
                                                  const CopilotApi* api);

private:
    IExecutor* m_executor;
    CredentialManager* m_credentials;
    CatalogCache* m_catalog;
    ModelRenamer* m_renamer;
    const CopilotApi* m_api;
    RequestTranslator m_requestTranslator;
    ResponseTranslator m_responseTranslator;

    struct PreparedPassthrough {
        QByteArray body;
        bool stream = false;
        bool vision = false;
        bool agentInitiated = false;
    };
    Result<PreparedPassthrough> preparePassthrough(const QByteArray& requestBody) const;
    Result<QString> backendToken(const QMap<QString, QString>& metadata) const;
};
