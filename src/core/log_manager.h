#pragma once
#include <QFile>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QVariantMap>
#include <atomic>

// Process-wide logger: stderr plus an optional log file, filtered by level.
// The most recent entries are also kept in memory.
class LogManager : public QObject {
    Q_OBJECT

public:
    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    static LogManager& instance();

    void initialize(const QString& logDir);

    void setMinimumLevel(Level level) { m_minLevel.store(level, std::memory_order_relaxed); }
    Level minimumLevel() const { return m_minLevel.load(std::memory_order_relaxed); }

    // Accepts debug/trace/info/warn/warning/error; anything else yields fallback.
    static Level parseLevel(const QString& name, Level fallback = Info);
    static QString formatMessage(Level level, const QString& category, const QString& message);

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, QStringLiteral("app"), msg); }
    void info(const QString& msg)    { log(Info, QStringLiteral("app"), msg); }
    void warning(const QString& msg) { log(Warning, QStringLiteral("app"), msg); }
    void error(const QString& msg)   { log(Error, QStringLiteral("app"), msg); }

    QVariantList recentLogs(int count = 200) const;
    void clearLogs();
    int maxBuffer() const { return m_maxBuffer; }

signals:
    void logEntry(int level, const QString& timestamp,
                  const QString& category, const QString& message);

private:
    LogManager() = default;
    ~LogManager() override;

    mutable QMutex m_mutex;
    QFile m_logFile;
    std::atomic<Level> m_minLevel{Info};
    QList<QVariantMap> m_buffer;
    int m_maxBuffer = 2000;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)
