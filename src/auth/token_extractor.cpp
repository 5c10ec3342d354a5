#include "token_extractor.h"
#include <QStringList>

QString TokenExtractor::extract(const QMap<QString, QString>& headers)
{
    QStringList candidates;
    candidates << headers.value(QStringLiteral("x-api-key")).trimmed();

    const QString authorization = headers.value(QStringLiteral("authorization")).trimmed();
    if (authorization.startsWith(QStringLiteral("bearer "), Qt::CaseInsensitive))
        candidates << authorization.mid(7).trimmed();

    candidates << headers.value(QStringLiteral("api-key")).trimmed();

    for (const QString& candidate : candidates) {
        if (looksLikeGithubToken(candidate))
            return candidate;
    }
    return {};
}

bool TokenExtractor::looksLikeGithubToken(const QString& token)
{
    static const QStringList prefixes = {
        QStringLiteral("ghp_"),
        QStringLiteral("gho_"),
        QStringLiteral("ghu_"),
        QStringLiteral("github_pat_"),
    };

    if (token.isEmpty())
        return false;
    for (const QString& prefix : prefixes) {
        if (token.startsWith(prefix) && token.size() > prefix.size())
            return true;
    }
    return false;
}
