#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    bool        retryable = false;
    bool        temporary = false;
    int         upstreamStatus = 0;

    int httpStatus() const;
    // Client-protocol error type ("invalid_request_error", "api_error", ...).
    QString errorType() const;
    QJsonObject toJson() const;

    // AuthError
    static DomainFailure missingToken();
    static DomainFailure exchangeFailed(const QString& msg);
    static DomainFailure expired();

    // TranslationError
    static DomainFailure invalidInput(const QString& code, const QString& msg);
    static DomainFailure unsupportedToolChoice(const QString& value);

    // UpstreamError / StreamError
    static DomainFailure upstream(int status, const QString& msg);
    static DomainFailure streamAborted(const QString& msg);

    static DomainFailure unauthorized(const QString& msg);
    static DomainFailure notFound(const QString& msg);
    static DomainFailure payloadTooLarge(qint64 size, qint64 limit);
    static DomainFailure notSupported(const QString& code, const QString& msg);
    static DomainFailure unavailable(const QString& msg);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure rateLimited(const QString& msg);
    static DomainFailure internal(const QString& msg);
};
