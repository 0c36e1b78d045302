#include "apppaths.h"

#include <QDir>
#include <QStandardPaths>

QString AppPaths::appDataDir()
{
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(base);
    return base;
}

QString AppPaths::defaultLogFilePath()
{
    return QDir(QDir(appDataDir()).filePath("logs")).filePath("password_service.log");
}
