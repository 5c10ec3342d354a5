#pragma once
#include <QtGlobal>

enum class ErrorKind : quint8 {
    InvalidInput,    // 400
    Unauthorized,    // 401
    Forbidden,       // 403
    NotFound,        // 404
    PayloadTooLarge, // 413
    RateLimited,     // 429
    Upstream,        // backend status, else 502
    StreamAborted,   // 502, surfaced as an SSE error event
    Unavailable,     // 503
    Timeout,         // 504
    NotSupported,    // 501
    Internal         // 500
};

// Client-protocol stop reasons. Other has no wire value of its own.
enum class StopReason : quint8 {
    EndTurn, MaxTokens, ToolUse, StopSequence, Refusal, Other
};
