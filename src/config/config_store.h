#pragma once
#include "config_types.h"
#include <QObject>
#include <QProcessEnvironment>

// Loads AppConfig from an optional JSON file, then applies environment
// overrides. Invalid values are logged and the previous value is kept.
class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    bool load(const QString& path);
    bool loadFromJson(const QByteArray& json);
    void applyEnvironment(const QProcessEnvironment& env);

    const AppConfig& config() const { return m_config; }
    QString filePath() const { return m_filePath; }

    static bool parseBool(const QString& value, bool* ok);
    static QHash<QString, QString> parseRenameMap(const QString& json, bool* ok);

signals:
    void configChanged();

private:
    AppConfig m_config;
    QString m_filePath;

    void applyIntEnv(const QProcessEnvironment& env, const QString& name,
                     int minValue, int maxValue, int& target);
    void applyBoolEnv(const QProcessEnvironment& env, const QString& name, bool& target);
};
