#pragma once
#include "auth/credential.h"
#include "semantic/ports.h"
#include "translate/chat_types.h"

// Builds the concrete backend requests (token exchange, chat completions,
// model list) and parses the token exchange reply.
class CopilotApi {
public:
    static constexpr const char* kTokenUrl = "https://api.github.com/copilot_internal/v2/token";
    static constexpr const char* kPluginVersion = "copilot-chat/0.26.7";
    static constexpr const char* kUserAgent = "GitHubCopilotChat/0.26.7";
    static constexpr const char* kApiVersion = "2025-04-01";

    explicit CopilotApi(const QString& accountType = QStringLiteral("individual"),
                        const QString& vscodeVersion = QStringLiteral("1.100.0"));

    QString baseUrl() const;
    QString accountType() const { return m_accountType; }
    QString vscodeVersion() const { return m_vscodeVersion; }

    ProviderRequest tokenExchangeRequest(const QString& githubToken) const;
    ProviderRequest chatCompletionsRequest(const ChatRequest& request,
                                           const QString& backendToken) const;
    // Pass-through variant: the body is already in the backend's format.
    ProviderRequest chatCompletionsRequest(const QByteArray& body, bool stream,
                                           bool vision, bool agentInitiated,
                                           const QString& backendToken) const;
    ProviderRequest modelsRequest(const QString& backendToken) const;

    static Result<Credential> parseTokenResponse(const QByteArray& body,
                                                 const QDateTime& now);

private:
    QString m_accountType;
    QString m_vscodeVersion;

    QMap<QString, QString> backendHeaders(const QString& backendToken,
                                          bool vision) const;
};
