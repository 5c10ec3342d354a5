#include "copilot_api.h"
#include "adapters/outbound/chat_codec.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>

CopilotApi::CopilotApi(const QString& accountType, const QString& vscodeVersion)
    : m_accountType(accountType.trimmed().isEmpty()
                        ? QStringLiteral("individual") : accountType.trimmed().toLower())
    , m_vscodeVersion(vscodeVersion.trimmed().isEmpty()
                          ? QStringLiteral("1.100.0") : vscodeVersion.trimmed())
{
}

QString CopilotApi::baseUrl() const
{
    if (m_accountType == QStringLiteral("individual"))
        return QStringLiteral("https://api.githubcopilot.com");
    return QStringLiteral("https://api.%1.githubcopilot.com").arg(m_accountType);
}

QMap<QString, QString> CopilotApi::backendHeaders(const QString& backendToken, bool vision) const
{
    QMap<QString, QString> headers;
    headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ") + backendToken;
    headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    headers[QStringLiteral("copilot-integration-id")] = QStringLiteral("vscode-chat");
    headers[QStringLiteral("editor-version")] = QStringLiteral("vscode/") + m_vscodeVersion;
    headers[QStringLiteral("editor-plugin-version")] = QString::fromLatin1(kPluginVersion);
    headers[QStringLiteral("user-agent")] = QString::fromLatin1(kUserAgent);
    headers[QStringLiteral("openai-intent")] = QStringLiteral("conversation-panel");
    headers[QStringLiteral("x-github-api-version")] = QString::fromLatin1(kApiVersion);
    headers[QStringLiteral("x-request-id")] = QUuid::createUuid().toString(QUuid::WithoutBraces);
    headers[QStringLiteral("x-vscode-user-agent-library-version")] = QStringLiteral("electron-fetch");
    if (vision)
        headers[QStringLiteral("copilot-vision-request")] = QStringLiteral("true");
    return headers;
}

ProviderRequest CopilotApi::tokenExchangeRequest(const QString& githubToken) const
{
    ProviderRequest req;
    req.method = QStringLiteral("GET");
    req.url = QString::fromLatin1(kTokenUrl);
    req.headers[QStringLiteral("authorization")] = QStringLiteral("token ") + githubToken;
    req.headers[QStringLiteral("accept")] = QStringLiteral("application/json");
    req.headers[QStringLiteral("editor-version")] = QStringLiteral("vscode/") + m_vscodeVersion;
    req.headers[QStringLiteral("editor-plugin-version")] = QString::fromLatin1(kPluginVersion);
    req.headers[QStringLiteral("user-agent")] = QString::fromLatin1(kUserAgent);
    req.headers[QStringLiteral("x-github-api-version")] = QString::fromLatin1(kApiVersion);
    return req;
}

ProviderRequest CopilotApi::chatCompletionsRequest(const ChatRequest& request,
                                                   const QString& backendToken) const
{
    return chatCompletionsRequest(ChatCodec::encodeRequest(request), request.stream,
                                  request.hasImages(), request.isAgentInitiated(),
                                  backendToken);
}

ProviderRequest CopilotApi::chatCompletionsRequest(const QByteArray& body, bool stream,
                                                   bool vision, bool agentInitiated,
                                                   const QString& backendToken) const
{
    ProviderRequest req;
    req.method = QStringLiteral("POST");
    req.url = baseUrl() + QStringLiteral("/chat/completions");
    req.headers = backendHeaders(backendToken, vision);
    req.headers[QStringLiteral("x-initiator")] = agentInitiated
        ? QStringLiteral("agent") : QStringLiteral("user");
    if (stream)
        req.headers[QStringLiteral("Accept")] = QStringLiteral("text/event-stream");
    req.body = body;
    req.stream = stream;
    return req;
}

ProviderRequest CopilotApi::modelsRequest(const QString& backendToken) const
{
    ProviderRequest req;
    req.method = QStringLiteral("GET");
    req.url = baseUrl() + QStringLiteral("/models");
    req.headers = backendHeaders(backendToken, false);
    req.headers.remove(QStringLiteral("Content-Type"));
    return req;
}

Result<Credential> CopilotApi::parseTokenResponse(const QByteArray& body, const QDateTime& now)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::exchangeFailed(
            QStringLiteral("Token exchange returned invalid JSON: ") + err.errorString()));
    }

    const QJsonObject root = doc.object();
    Credential credential;
    credential.token = root.value(QStringLiteral("token")).toString();
    if (credential.token.isEmpty()) {
        return std::unexpected(DomainFailure::exchangeFailed(
            QStringLiteral("Token exchange response has no token")));
    }

    // expires_at is absolute; expires_in and refresh_in are relative to now.
    const qint64 expiresAt = root.value(QStringLiteral("expires_at")).toVariant().toLongLong();
    const qint64 expiresIn = root.value(QStringLiteral("expires_in")).toVariant().toLongLong();
    const qint64 refreshIn = root.value(QStringLiteral("refresh_in")).toVariant().toLongLong();

    if (expiresIn > 0)
        credential.expiresAt = now.addSecs(expiresIn);
    else if (expiresAt > 0)
        credential.expiresAt = QDateTime::fromSecsSinceEpoch(expiresAt, Qt::UTC);
    else if (refreshIn > 0)
        credential.expiresAt = now.addSecs(refreshIn + 60);
    else
        return std::unexpected(DomainFailure::exchangeFailed(
            QStringLiteral("Token exchange response has no expiry")));

    if (credential.expiresAt <= now) {
        return std::unexpected(DomainFailure::exchangeFailed(
            QStringLiteral("Token exchange returned an already expired token")));
    }
    return credential;
}
