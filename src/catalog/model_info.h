#pragma once
#include <QList>
#include <QString>

struct ModelInfo {
    QString backendId;
    QString clientId;
    QString displayName;
    QString vendor;
    qint64 created = 0;
};

using ModelList = QList<ModelInfo>;
