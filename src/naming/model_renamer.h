#pragma once
#include <QHash>
#include <QReadWriteLock>
#include <QString>

// Maps backend model ids to client-facing ids and back.
//
// toClient: strip a trailing date token, then the override table, then the
// claude pattern rules (when enabled), otherwise pass through.
// toBackend: strip a trailing date token, then the reversed override table,
// then ids learned from the catalog, otherwise pass through.
//
// When several backend ids collapse onto one client id, the learned reverse
// entry keeps the canonical representative: a backend id equal to the
// client id if one exists, else the first one learned.
class ModelRenamer {
public:
    explicit ModelRenamer(const QHash<QString, QString>& overrides = {},
                          bool autoRename = true);

    QString toClient(const QString& backendId) const;
    QString toBackend(const QString& clientId) const;

    // Records backendId as a source of toClient(backendId). Returns the client id.
    QString learn(const QString& backendId);
    void clearLearned();
    int learnedCount() const;

    bool autoRenameEnabled() const { return m_autoRename; }
    const QHash<QString, QString>& overrides() const { return m_overrides; }

    static QString stripDateSuffix(const QString& id);
    static QString replaceVersionDots(const QString& id);
    // Empty when no rule applies.
    static QString autoRename(const QString& id);

private:
    QHash<QString, QString> m_overrides;
    QHash<QString, QString> m_overridesReverse;
    bool m_autoRename;

    mutable QReadWriteLock m_lock;
    QHash<QString, QString> m_learnedReverse;
};
