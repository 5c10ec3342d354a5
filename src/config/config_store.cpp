#include "config_store.h"
#include "core/log_manager.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

QHash<QString, QString> toRenameMap(const QJsonObject& obj)
{
    QHash<QString, QString> map;
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (it.value().isString() && !it.key().isEmpty())
            map.insert(it.key(), it.value().toString());
    }
    return map;
}

}

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

bool ConfigStore::load(const QString& path)
{
    m_filePath = path;
    if (m_filePath.isEmpty())
        return false;

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARNING(QStringLiteral("ConfigStore: cannot open %1").arg(m_filePath));
        return false;
    }
    return loadFromJson(file.readAll());
}

bool ConfigStore::loadFromJson(const QByteArray& json)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARNING(QStringLiteral("ConfigStore: invalid config JSON: %1").arg(err.errorString()));
        return false;
    }

    const QJsonObject root = doc.object();

    m_config.port = clampInt(jsonIntEither(root, "port", "port", m_config.port), 1, 65535);
    m_config.logLevel = jsonStringEither(root, "log_level", "logLevel", m_config.logLevel);
    m_config.logDir = jsonStringEither(root, "log_dir", "logDir", m_config.logDir);
    m_config.githubToken = jsonStringEither(root, "gh_token", "ghToken", m_config.githubToken);
    m_config.accountType = jsonStringEither(root, "account_type", "accountType", m_config.accountType);
    m_config.vscodeVersion = jsonStringEither(root, "vscode_version", "vscodeVersion", m_config.vscodeVersion);

    const QJsonValue renameMap = jsonValueEither(root, "model_rename_map", "modelRenameMap");
    if (renameMap.isObject())
        m_config.modelRenameMap = toRenameMap(renameMap.toObject());

    m_config.modelRenameAuto = jsonBoolEither(root, "model_rename_auto", "modelRenameAuto", m_config.modelRenameAuto);
    m_config.emulateThinking = jsonBoolEither(root, "emulate_thinking", "emulateThinking", m_config.emulateThinking);
    m_config.modelsCacheTtl = qMax(0, jsonIntEither(root, "models_cache_ttl", "modelsCacheTtl", m_config.modelsCacheTtl));
    m_config.tokenRefreshMargin = qMax(0, jsonIntEither(root, "token_refresh_margin", "tokenRefreshMargin", m_config.tokenRefreshMargin));
    m_config.requestTimeout = qMax(1000, jsonIntEither(root, "request_timeout", "requestTimeout", m_config.requestTimeout));
    m_config.connectionTimeout = qMax(1000, jsonIntEither(root, "connection_timeout", "connectionTimeout", m_config.connectionTimeout));
    m_config.maxBodyBytes = qMax(1024, jsonIntEither(root, "max_body_bytes", "maxBodyBytes", m_config.maxBodyBytes));

    emit configChanged();
    return true;
}

bool ConfigStore::parseBool(const QString& value, bool* ok)
{
    const QString v = value.trimmed().toLower();
    if (v == QStringLiteral("1") || v == QStringLiteral("true") || v == QStringLiteral("yes")
        || v == QStringLiteral("on")) {
        if (ok) *ok = true;
        return true;
    }
    if (v == QStringLiteral("0") || v == QStringLiteral("false") || v == QStringLiteral("no")
        || v == QStringLiteral("off")) {
        if (ok) *ok = true;
        return false;
    }
    if (ok) *ok = false;
    return false;
}

QHash<QString, QString> ConfigStore::parseRenameMap(const QString& json, bool* ok)
{
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject()) {
        if (ok) *ok = false;
        return {};
    }
    if (ok) *ok = true;
    return toRenameMap(doc.object());
}

void ConfigStore::applyIntEnv(const QProcessEnvironment& env, const QString& name,
                              int minValue, int maxValue, int& target)
{
    if (!env.contains(name))
        return;
    bool ok = false;
    const int value = env.value(name).trimmed().toInt(&ok);
    if (!ok || value < minValue || value > maxValue) {
        LOG_WARNING(QStringLiteral("ConfigStore: ignoring invalid %1=%2").arg(name, env.value(name)));
        return;
    }
    target = value;
}

void ConfigStore::applyBoolEnv(const QProcessEnvironment& env, const QString& name, bool& target)
{
    if (!env.contains(name))
        return;
    bool ok = false;
    const bool value = parseBool(env.value(name), &ok);
    if (!ok) {
        LOG_WARNING(QStringLiteral("ConfigStore: ignoring invalid %1=%2").arg(name, env.value(name)));
        return;
    }
    target = value;
}

void ConfigStore::applyEnvironment(const QProcessEnvironment& env)
{
    applyIntEnv(env, QStringLiteral("PORT"), 1, 65535, m_config.port);

    if (env.contains(QStringLiteral("LOG_LEVEL")))
        m_config.logLevel = env.value(QStringLiteral("LOG_LEVEL")).trimmed().toLower();
    if (env.contains(QStringLiteral("LOG_DIR")))
        m_config.logDir = env.value(QStringLiteral("LOG_DIR")).trimmed();
    if (env.contains(QStringLiteral("GH_TOKEN")))
        m_config.githubToken = env.value(QStringLiteral("GH_TOKEN")).trimmed();

    if (env.contains(QStringLiteral("ACCOUNT_TYPE"))) {
        const QString accountType = env.value(QStringLiteral("ACCOUNT_TYPE")).trimmed().toLower();
        if (accountType.isEmpty())
            LOG_WARNING(QStringLiteral("ConfigStore: ignoring empty ACCOUNT_TYPE"));
        else
            m_config.accountType = accountType;
    }
    if (env.contains(QStringLiteral("VSCODE_VERSION")) && !env.value(QStringLiteral("VSCODE_VERSION")).trimmed().isEmpty())
        m_config.vscodeVersion = env.value(QStringLiteral("VSCODE_VERSION")).trimmed();

    if (env.contains(QStringLiteral("MODEL_RENAME_MAP"))) {
        bool ok = false;
        const auto map = parseRenameMap(env.value(QStringLiteral("MODEL_RENAME_MAP")), &ok);
        if (ok)
            m_config.modelRenameMap = map;
        else
            LOG_WARNING(QStringLiteral("ConfigStore: MODEL_RENAME_MAP is not a JSON object, ignored"));
    }

    applyBoolEnv(env, QStringLiteral("MODEL_RENAME_AUTO"), m_config.modelRenameAuto);
    applyBoolEnv(env, QStringLiteral("EMULATE_THINKING"), m_config.emulateThinking);
    applyIntEnv(env, QStringLiteral("MODELS_CACHE_TTL"), 0, 7 * 24 * 3600, m_config.modelsCacheTtl);
    applyIntEnv(env, QStringLiteral("TOKEN_REFRESH_MARGIN"), 0, 3600, m_config.tokenRefreshMargin);
    applyIntEnv(env, QStringLiteral("REQUEST_TIMEOUT"), 1000, 3600000, m_config.requestTimeout);
    applyIntEnv(env, QStringLiteral("CONNECTION_TIMEOUT"), 1000, 600000, m_config.connectionTimeout);
    applyIntEnv(env, QStringLiteral("MAX_BODY_BYTES"), 1024, 512 * 1024 * 1024, m_config.maxBodyBytes);

    emit configChanged();
}
