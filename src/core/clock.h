#pragma once
#include <QDateTime>
#include <functional>

// Injected wall clock; tests substitute a controllable one.
using Clock = std::function<QDateTime()>;

inline QDateTime systemNow()
{
    return QDateTime::currentDateTimeUtc();
}
