#include "logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStringConverter>
#include <QTextStream>

#include <cstdio>
#include <cstdlib>

static QMutex g_logMutex;
static QString g_logFilePath;
static bool g_initialized = false;

void Logging::init(const QString &logFilePath)
{
    QMutexLocker locker(&g_logMutex);

    g_logFilePath = logFilePath;
    if (!g_logFilePath.isEmpty())
        QDir().mkpath(QFileInfo(g_logFilePath).absolutePath());

    if (g_initialized)
        return;
    g_initialized = true;
    qInstallMessageHandler(&Logging::messageHandler);
}

static QString levelToString(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return "DEBUG";
    case QtInfoMsg:
        return "INFO";
    case QtWarningMsg:
        return "WARN";
    case QtCriticalMsg:
        return "ERROR";
    case QtFatalMsg:
        return "FATAL";
    default:
        return "LOG";
    }
}

void Logging::messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    QMutexLocker locker(&g_logMutex);

    const auto ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    auto line = QString("%1 [%2] %3").arg(ts, levelToString(type), msg);
    if (context.file && context.line > 0)
        line += QString(" (%1:%2)").arg(QString::fromUtf8(context.file)).arg(context.line);

    std::fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
    std::fflush(stderr);

    if (!g_logFilePath.isEmpty()) {
        QFile file(g_logFilePath);
        if (file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            QTextStream out(&file);
            out.setEncoding(QStringConverter::Utf8);
            out << line << "\n";
        }
    }

    if (type == QtFatalMsg)
        abort();
}
