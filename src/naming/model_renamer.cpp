#include "model_renamer.h"
#include "core/log_manager.h"
#include <QRegularExpression>
#include <QStringList>

ModelRenamer::ModelRenamer(const QHash<QString, QString>& overrides, bool autoRename)
    : m_overrides(overrides)
    , m_autoRename(autoRename)
{
    for (auto it = m_overrides.constBegin(); it != m_overrides.constEnd(); ++it) {
        if (m_overridesReverse.contains(it.value())) {
            LOG_WARNING(QStringLiteral("ModelRenamer: override target '%1' is used twice, keeping '%2'")
                            .arg(it.value(), m_overridesReverse.value(it.value())));
            continue;
        }
        m_overridesReverse.insert(it.value(), it.key());
    }
}

QString ModelRenamer::stripDateSuffix(const QString& id)
{
    static const QRegularExpression compact(QStringLiteral("-\\d{8}$"));
    static const QRegularExpression dashed(QStringLiteral("-\\d{4}-\\d{2}-\\d{2}$"));

    QString result = id;
    result.remove(dashed);
    if (result.size() == id.size())
        result.remove(compact);
    return result;
}

QString ModelRenamer::replaceVersionDots(const QString& id)
{
    QString result = id;
    for (int i = 1; i + 1 < result.size(); ++i) {
        if (result.at(i) == QLatin1Char('.')
            && result.at(i - 1).isDigit()
            && result.at(i + 1).isDigit()) {
            result[i] = QLatin1Char('-');
        }
    }
    return result;
}

QString ModelRenamer::autoRename(const QString& id)
{
    static const QString prefix = QStringLiteral("claude-");
    if (!id.startsWith(prefix))
        return QString();

    const QString rest = id.mid(prefix.size());
    const QStringList segments = rest.split(QLatin1Char('-'));
    auto startsWithDigit = [](const QString& s) {
        return !s.isEmpty() && s.at(0).isDigit();
    };

    if (!segments.isEmpty() && startsWithDigit(segments.first())) {
        // claude-3.5-sonnet -> claude-sonnet-3-5
        int versionEnd = 0;
        while (versionEnd < segments.size() && startsWithDigit(segments.at(versionEnd)))
            ++versionEnd;
        if (versionEnd == segments.size())
            return QString();
        const QString version = replaceVersionDots(segments.mid(0, versionEnd).join(QLatin1Char('-')));
        const QString variant = segments.mid(versionEnd).join(QLatin1Char('-'));
        return prefix + variant + QLatin1Char('-') + version;
    }

    // claude-sonnet-4.5 -> claude-sonnet-4-5
    const QString normalized = replaceVersionDots(rest);
    if (normalized == rest)
        return QString();
    return prefix + normalized;
}

QString ModelRenamer::toClient(const QString& backendId) const
{
    const QString base = stripDateSuffix(backendId);

    auto it = m_overrides.constFind(backendId);
    if (it != m_overrides.constEnd())
        return it.value();
    it = m_overrides.constFind(base);
    if (it != m_overrides.constEnd())
        return it.value();

    if (m_autoRename) {
        const QString renamed = autoRename(base);
        if (!renamed.isEmpty())
            return renamed;
    }
    return base;
}

QString ModelRenamer::toBackend(const QString& clientId) const
{
    const QString base = stripDateSuffix(clientId);

    for (const QString& key : {clientId, base}) {
        auto it = m_overridesReverse.constFind(key);
        if (it != m_overridesReverse.constEnd())
            return it.value();
    }

    QReadLocker locker(&m_lock);
    for (const QString& key : {clientId, base}) {
        auto learned = m_learnedReverse.constFind(key);
        if (learned != m_learnedReverse.constEnd())
            return learned.value();
    }

    return base;
}

QString ModelRenamer::learn(const QString& backendId)
{
    const QString clientId = toClient(backendId);
    if (clientId.isEmpty())
        return clientId;

    QWriteLocker locker(&m_lock);
    auto it = m_learnedReverse.find(clientId);
    if (it == m_learnedReverse.end()) {
        m_learnedReverse.insert(clientId, backendId);
    } else if (backendId == clientId && it.value() != clientId) {
        it.value() = backendId;
    }
    return clientId;
}

void ModelRenamer::clearLearned()
{
    QWriteLocker locker(&m_lock);
    m_learnedReverse.clear();
}

int ModelRenamer::learnedCount() const
{
    QReadLocker locker(&m_lock);
    return m_learnedReverse.size();
}
