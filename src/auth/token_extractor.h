#pragma once
#include <QMap>
#include <QString>

// Pulls the caller's long-lived token out of request headers.
// Header names are expected lowercased.
class TokenExtractor {
public:
    static QString extract(const QMap<QString, QString>& headers);
    static bool looksLikeGithubToken(const QString& token);
};
