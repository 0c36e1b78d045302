#pragma once

#include <QString>

class AppPaths final
{
public:
    static QString appDataDir();
    static QString defaultLogFilePath();
};
