#pragma once

#include <QtGlobal>

class QMessageLogContext;
class QString;

class Logging final
{
public:
    // Installs the handler once; later calls only switch the target file.
    static void init(const QString &logFilePath);

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg);
};
