#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QTextStream>
#include <QDebug>
#include <cstdio>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    if (logDir.isEmpty())
        return;
    QDir().mkpath(logDir);
    const QString logPath = logDir + QStringLiteral("/msgbridge.log");
    if (m_logFile.isOpen())
        m_logFile.close();
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
        qWarning() << "LogManager: failed to open log file:" << logPath;
}

LogManager::Level LogManager::parseLevel(const QString& name, Level fallback)
{
    const QString lowered = name.trimmed().toLower();
    if (lowered == QStringLiteral("debug") || lowered == QStringLiteral("trace"))
        return Debug;
    if (lowered == QStringLiteral("info"))
        return Info;
    if (lowered == QStringLiteral("warn") || lowered == QStringLiteral("warning"))
        return Warning;
    if (lowered == QStringLiteral("error"))
        return Error;
    return fallback;
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    const QString timestamp = QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz"));
    return QStringLiteral("[%1] [%2] [%3] %4")
        .arg(timestamp, QLatin1String(kLevelNames[level]), category, message);
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error)
        level = Error;
    if (level < minimumLevel())
        return;

    const QString timestamp = QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz"));
    const QString formatted = QStringLiteral("[%1] [%2] [%3] %4")
        .arg(timestamp, QLatin1String(kLevelNames[level]), category, message);

    {
        QMutexLocker locker(&m_mutex);
        const QByteArray line = formatted.toUtf8();
        std::fprintf(stderr, "%s\n", line.constData());

        if (m_logFile.isOpen()) {
            QTextStream stream(&m_logFile);
            stream << formatted << "\n";
            stream.flush();
        }

        QVariantMap entry;
        entry[QStringLiteral("level")] = static_cast<int>(level);
        entry[QStringLiteral("timestamp")] = timestamp;
        entry[QStringLiteral("category")] = category;
        entry[QStringLiteral("message")] = message;
        m_buffer.append(entry);
        while (m_buffer.size() > m_maxBuffer)
            m_buffer.removeFirst();
    }

    emit logEntry(static_cast<int>(level), timestamp, category, message);
}

QVariantList LogManager::recentLogs(int count) const {
    QMutexLocker locker(&m_mutex);
    QVariantList result;
    const qsizetype start = qMax<qsizetype>(0, m_buffer.size() - count);
    for (qsizetype i = start; i < m_buffer.size(); ++i)
        result.append(m_buffer[i]);
    return result;
}

void LogManager::clearLogs() {
    QMutexLocker locker(&m_mutex);
    m_buffer.clear();
}
