#include "failure.h"

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::InvalidInput:  return 400;
    case ErrorKind::Unauthorized:  return 401;
    case ErrorKind::Forbidden:     return 403;
    case ErrorKind::NotFound:      return 404;
    case ErrorKind::PayloadTooLarge: return 413;
    case ErrorKind::RateLimited:   return 429;
    case ErrorKind::Upstream:
        return (upstreamStatus >= 400 && upstreamStatus <= 599) ? upstreamStatus : 502;
    case ErrorKind::StreamAborted: return 502;
    case ErrorKind::NotSupported:  return 501;
    case ErrorKind::Unavailable:   return 503;
    case ErrorKind::Timeout:       return 504;
    case ErrorKind::Internal:
    default:                       return 500;
    }
}

QString DomainFailure::errorType() const {
    switch (kind) {
    case ErrorKind::InvalidInput:
    case ErrorKind::NotSupported:  return QStringLiteral("invalid_request_error");
    case ErrorKind::Unauthorized:
    case ErrorKind::Forbidden:     return QStringLiteral("authentication_error");
    case ErrorKind::NotFound:      return QStringLiteral("not_found_error");
    case ErrorKind::PayloadTooLarge: return QStringLiteral("request_too_large");
    case ErrorKind::RateLimited:   return QStringLiteral("rate_limit_error");
    case ErrorKind::Unavailable:   return QStringLiteral("overloaded_error");
    case ErrorKind::Upstream:
        if (upstreamStatus == 401 || upstreamStatus == 403)
            return QStringLiteral("authentication_error");
        if (upstreamStatus == 429)
            return QStringLiteral("rate_limit_error");
        if (upstreamStatus == 400 || upstreamStatus == 422)
            return QStringLiteral("invalid_request_error");
        return QStringLiteral("api_error");
    case ErrorKind::StreamAborted:
    case ErrorKind::Timeout:
    case ErrorKind::Internal:
    default:                       return QStringLiteral("api_error");
    }
}

QJsonObject DomainFailure::toJson() const {
    QJsonObject err;
    err["type"] = errorType();
    err["message"] = message;
    QJsonObject root;
    root["type"] = QStringLiteral("error");
    root["error"] = err;
    return root;
}

DomainFailure DomainFailure::missingToken() {
    return {ErrorKind::Forbidden, "auth.missing_token",
            "No GitHub token available. Configure GH_TOKEN or send a GitHub token "
            "via the x-api-key or Authorization header.", false, false};
}

DomainFailure DomainFailure::exchangeFailed(const QString& msg) {
    return {ErrorKind::Unauthorized, "auth.exchange_failed",
            QStringLiteral("Copilot token exchange failed: %1").arg(msg), false, false};
}

DomainFailure DomainFailure::expired() {
    return {ErrorKind::Unauthorized, "auth.expired",
            "Copilot token expired and could not be refreshed", false, true};
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, code, msg, false, false};
}

DomainFailure DomainFailure::unsupportedToolChoice(const QString& value) {
    return {ErrorKind::InvalidInput, "translation.unsupported_tool_choice",
            QStringLiteral("tool_choice: unsupported value '%1'").arg(value), false, false};
}

DomainFailure DomainFailure::upstream(int status, const QString& msg) {
    DomainFailure failure{ErrorKind::Upstream, QStringLiteral("upstream.http_%1").arg(status),
                          msg, false, false};
    failure.upstreamStatus = status;
    return failure;
}

DomainFailure DomainFailure::streamAborted(const QString& msg) {
    return {ErrorKind::StreamAborted, "stream.aborted", msg, false, true};
}

DomainFailure DomainFailure::unauthorized(const QString& msg) {
    return {ErrorKind::Unauthorized, "unauthorized", msg, false, false};
}

DomainFailure DomainFailure::notFound(const QString& msg) {
    return {ErrorKind::NotFound, "not_found", msg, false, false};
}

DomainFailure DomainFailure::notSupported(const QString& code, const QString& msg) {
    return {ErrorKind::NotSupported, code, msg, false, false};
}

DomainFailure DomainFailure::unavailable(const QString& msg) {
    return {ErrorKind::Unavailable, "unavailable", msg, true, true};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::Timeout, "timeout", msg, true, true};
}

DomainFailure DomainFailure::rateLimited(const QString& msg) {
    return {ErrorKind::RateLimited, "rate_limited", msg, true, true};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg, false, false};
}

DomainFailure DomainFailure::payloadTooLarge(qint64 size, qint64 limit) {
    return {ErrorKind::PayloadTooLarge, "request.too_large",
            QStringLiteral("Request body of %1 bytes exceeds the %2 byte limit").arg(size).arg(limit),
            false, false};
}
