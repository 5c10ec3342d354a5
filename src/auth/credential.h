#pragma once
#include <QDateTime>
#include <QString>

// Short-lived backend token obtained by exchanging a long-lived one.
struct Credential {
    QString token;
    QDateTime expiresAt;

    bool isValidAt(const QDateTime& now) const {
        return !token.isEmpty() && now < expiresAt;
    }
};
