#pragma once
#include <QHash>
#include <QString>

struct AppConfig {
    int port = 4141;
    QString logLevel = QStringLiteral("info");
    QString logDir;

    // Operator long-lived token; empty means callers bring their own.
    QString githubToken;
    QString accountType = QStringLiteral("individual");
    QString vscodeVersion = QStringLiteral("1.100.0");

    QHash<QString, QString> modelRenameMap;
    bool modelRenameAuto = true;
    bool emulateThinking = true;

    int modelsCacheTtl = 300;       // seconds, 0 disables caching
    int tokenRefreshMargin = 60;    // seconds
    int requestTimeout = 120000;    // ms
    int connectionTimeout = 30000;  // ms
    int maxBodyBytes = 32 * 1024 * 1024;
};
