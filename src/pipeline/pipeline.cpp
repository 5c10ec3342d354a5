#include "pipeline.h"
#include "adapters/inbound/messages_codec.h"
#include "adapters/outbound/chat_codec.h"
#include "adapters/outbound/copilot_api.h"
#include "auth/credential_manager.h"
#include "core/log_manager.h"
#include "naming/model_renamer.h"
#include "semantic/stream_session.h"
#include "translate/stream_translator.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

// ========== PipelineStreamSession ==========

PipelineStreamSession::PipelineStreamSession(
        StreamSession* upstream,
        std::unique_ptr<StreamTranslator> translator,
        QObject* parent)
    : QObject(parent)
    , m_upstream(upstream)
    , m_translator(std::move(translator))
{
    m_upstream->setParent(this);
    connect(m_upstream, &StreamSession::dataReady,
            this, &PipelineStreamSession::onUpstreamData);
    connect(m_upstream, &StreamSession::finished,
            this, &PipelineStreamSession::onUpstreamFinished);
    connect(m_upstream, &StreamSession::error,
            this, &PipelineStreamSession::onUpstreamError);
}

PipelineStreamSession::~PipelineStreamSession() = default;

void PipelineStreamSession::abort() {
    m_done = true;
    if (m_upstream) m_upstream->abort();
}

void PipelineStreamSession::emitEvents(const QList<StreamEvent>& events) {
    for (const StreamEvent& event : events)
        emit encodedFrameReady(MessagesCodec::encodeEvent(event));
}

void PipelineStreamSession::onUpstreamData(const QByteArray& data) {
    if (m_done) return;

    if (!m_translator) {
        emit encodedFrameReady(QByteArrayLiteral("data: ") + data + QByteArrayLiteral("\n\n"));
        return;
    }

    auto chunk = ChatCodec::decodeChunk(data);
    if (!chunk) {
        LOG_WARNING(QStringLiteral("PipelineStreamSession: skipping malformed chunk: %1")
                        .arg(chunk.error().message));
        return;
    }

    emitEvents(m_translator->translate(*chunk));
    if (m_translator->isTerminated()) {
        m_done = true;
        m_upstream->abort();
        emit finished();
    }
}

void PipelineStreamSession::onUpstreamFinished() {
    if (m_done) return;
    m_done = true;

    if (m_translator)
        emitEvents(m_translator->finish());
    else
        emit encodedFrameReady(QByteArrayLiteral("data: [DONE]\n\n"));
    emit finished();
}

void PipelineStreamSession::onUpstreamError(const DomainFailure& failure) {
    if (m_done) return;
    m_done = true;

    emit error(failure);
    if (m_translator) {
        emitEvents(m_translator->fail(failure));
    } else {
        QJsonObject err;
        err[QStringLiteral("message")] = failure.message;
        err[QStringLiteral("type")] = failure.errorType();
        err[QStringLiteral("code")] = failure.code;
        QJsonObject root;
        root[QStringLiteral("error")] = err;
        emit encodedFrameReady(QByteArrayLiteral("data: ")
                               + QJsonDocument(root).toJson(QJsonDocument::Compact)
                               + QByteArrayLiteral("\n\n"));
    }
    emit finished();
}

// ========== Pipeline ==========

Pipeline::Pipeline(IExecutor* executor,
                   CredentialManager* credentials,
                   CatalogCache* catalog,
                   ModelRenamer* renamer,
                   const CopilotApi* api,
                   RequestTranslatorOptions options,
                   QObject* parent)
    : QObject(parent)
    , m_executor(executor)
    , m_credentials(credentials)
    , m_catalog(catalog)
    , m_renamer(renamer)
    , m_api(api)
    , m_requestTranslator(renamer, options)
    , m_responseTranslator(renamer)
{
}

bool Pipeline::isStreamRequest(const QByteArray& requestBody) {
    const QJsonDocument doc = QJsonDocument::fromJson(requestBody);
    return doc.isObject() && doc.object().value(QStringLiteral("stream")).toBool(false);
}

Result<QString> Pipeline::backendToken(const QMap<QString, QString>& metadata) const {
    if (!m_credentials)
        return std::unexpected(DomainFailure::missingToken());
    auto credential = m_credentials->resolve(metadata.value(PipelineMeta::CallerToken));
    if (!credential) return std::unexpected(credential.error());
    return credential->token;
}

Result<QByteArray> Pipeline::process(const QByteArray& requestBody,
                                     const QMap<QString, QString>& metadata) {
    auto decoded = MessagesCodec::decodeRequest(requestBody);
    if (!decoded) return std::unexpected(decoded.error());
    decoded->stream = false;

    auto chat = m_requestTranslator.translate(*decoded);
    if (!chat) return std::unexpected(chat.error());

    auto token = backendToken(metadata);
    if (!token) return std::unexpected(token.error());

    LOG_DEBUG(QStringLiteral("Pipeline: %1 -> %2 (non-stream)")
                  .arg(decoded->model, chat->model));

    auto response = m_executor->execute(m_api->chatCompletionsRequest(*chat, *token));
    if (!response) return std::unexpected(response.error());
    if (!response->isSuccess())
        return std::unexpected(ChatCodec::mapFailure(response->statusCode, response->body));

    auto backendReply = ChatCodec::decodeResponse(response->body);
    if (!backendReply) return std::unexpected(backendReply.error());

    auto translated = m_responseTranslator.translate(
        *backendReply, decoded->model, m_requestTranslator.thinkingActive(*decoded));
    if (!translated) return std::unexpected(translated.error());

    return MessagesCodec::encodeResponse(*translated);
}

Result<PipelineStreamSession*> Pipeline::processStream(
        const QByteArray& requestBody,
        const QMap<QString, QString>& metadata) {
    auto decoded = MessagesCodec::decodeRequest(requestBody);
    if (!decoded) return std::unexpected(decoded.error());
    decoded->stream = true;

    auto chat = m_requestTranslator.translate(*decoded);
    if (!chat) return std::unexpected(chat.error());

    auto token = backendToken(metadata);
    if (!token) return std::unexpected(token.error());

    LOG_DEBUG(QStringLiteral("Pipeline: %1 -> %2 (stream)")
                  .arg(decoded->model, chat->model));

    auto reply = m_executor->connectStream(m_api->chatCompletionsRequest(*chat, *token));
    if (!reply) return std::unexpected(reply.error());

    const QString clientModel = m_renamer ? m_renamer->toClient(decoded->model) : decoded->model;
    auto translator = std::make_unique<StreamTranslator>(
        clientModel, m_requestTranslator.thinkingActive(*decoded));

    auto* upstream = new StreamSession(*reply);
    return new PipelineStreamSession(upstream, std::move(translator), this);
}

Result<Pipeline::PreparedPassthrough> Pipeline::preparePassthrough(
        const QByteArray& requestBody) const {
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(requestBody, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_json"),
            QStringLiteral("Request body is not a JSON object: ") + err.errorString()));
    }

    QJsonObject root = doc.object();
    const QString model = root.value(QStringLiteral("model")).toString();
    if (model.isEmpty()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("translation.invalid_input"), QStringLiteral("model: field is required")));
    }
    if (m_renamer)
        root[QStringLiteral("model")] = m_renamer->toBackend(model);

    PreparedPassthrough prepared;
    prepared.stream = root.value(QStringLiteral("stream")).toBool(false);

    const QJsonArray messages = root.value(QStringLiteral("messages")).toArray();
    for (const QJsonValue& mv : messages) {
        const QJsonObject message = mv.toObject();
        const QString role = message.value(QStringLiteral("role")).toString();
        if (role == QStringLiteral("assistant") || role == QStringLiteral("tool"))
            prepared.agentInitiated = true;

        const QJsonArray parts = message.value(QStringLiteral("content")).toArray();
        for (const QJsonValue& pv : parts) {
            if (pv.toObject().value(QStringLiteral("type")).toString() == QStringLiteral("image_url"))
                prepared.vision = true;
        }
    }

    prepared.body = QJsonDocument(root).toJson(QJsonDocument::Compact);
    return prepared;
}

Result<ProviderResponse> Pipeline::passthrough(const QByteArray& requestBody,
                                               const QMap<QString, QString>& metadata) {
    auto prepared = preparePassthrough(requestBody);
    if (!prepared) return std::unexpected(prepared.error());

    auto token = backendToken(metadata);
    if (!token) return std::unexpected(token.error());

    return m_executor->execute(m_api->chatCompletionsRequest(
        prepared->body, false, prepared->vision, prepared->agentInitiated, *token));
}

Result<PipelineStreamSession*> Pipeline::passthroughStream(
        const QByteArray& requestBody,
        const QMap<QString, QString>& metadata) {
    auto prepared = preparePassthrough(requestBody);
    if (!prepared) return std::unexpected(prepared.error());

    auto token = backendToken(metadata);
    if (!token) return std::unexpected(token.error());

    auto reply = m_executor->connectStream(m_api->chatCompletionsRequest(
        prepared->body, true, prepared->vision, prepared->agentInitiated, *token));
    if (!reply) return std::unexpected(reply.error());

    auto* upstream = new StreamSession(*reply);
    return new PipelineStreamSession(upstream, nullptr, this);
}

QFuture<Result<ModelList>> Pipeline::listModels(const QMap<QString, QString>& metadata) {
    if (!m_catalog) {
        return makeReadyResult<ModelList>(std::unexpected(
            DomainFailure::unavailable(QStringLiteral("model catalog not configured"))));
    }
    return m_catalog->getModels(metadata.value(PipelineMeta::CallerToken));
}

CatalogCache::Fetcher Pipeline::makeModelFetcher(IExecutor* executor,
                                                 CredentialManager* credentials,
                                                 const CopilotApi* api) {
    return [executor, credentials, api](const QString& callerToken)
               -> QFuture<Result<ModelList>> {
        auto credential = credentials->resolve(callerToken);
        if (!credential)
            return makeReadyResult<ModelList>(std::unexpected(credential.error()));

        return executor->executeAsync(api->modelsRequest(credential->token))
            .then([](Result<ProviderResponse> response) -> Result<ModelList> {
                if (!response) return std::unexpected(response.error());
                if (!response->isSuccess())
                    return std::unexpected(ChatCodec::mapFailure(response->statusCode,
                                                                 response->body));
                return ChatCodec::decodeModelList(response->body);
            });
    };
}
