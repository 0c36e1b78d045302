#pragma once

#include <QHostAddress>
#include <QString>

#include <optional>

class QCommandLineParser;

struct ServiceConfig final
{
    QHostAddress address = QHostAddress(QHostAddress::AnyIPv4);
    quint16 port = 3000;
    int maxPasswordLength = 128;
    QString logFilePath;
};

namespace ServiceOptions {

void addOptions(QCommandLineParser &parser);

// Reads the options registered by addOptions() from an already parsed parser.
std::optional<ServiceConfig> configFromParser(const QCommandLineParser &parser, QString *errorOut = nullptr);

} // namespace ServiceOptions
