#include "serviceconfig.h"

#include "core/apppaths.h"

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace {

constexpr auto kPortOption = "port";
constexpr auto kAddressOption = "address";
constexpr auto kMaxLengthOption = "max-length";
constexpr auto kLogFileOption = "log-file";

} // namespace

namespace ServiceOptions {

void addOptions(QCommandLineParser &parser)
{
    parser.addOption(QCommandLineOption(QStringList{"p", kPortOption}, "Port to listen on.", "port", "3000"));
    parser.addOption(QCommandLineOption(QStringList{"a", kAddressOption}, "Address to bind to.", "address", "0.0.0.0"));
    parser.addOption(
        QCommandLineOption(kMaxLengthOption, "Longest password a request may ask for.", "length", "128"));
    parser.addOption(QCommandLineOption(kLogFileOption, "Log file path.", "path"));
}

std::optional<ServiceConfig> configFromParser(const QCommandLineParser &parser, QString *errorOut)
{
    const auto fail = [&](const QString &msg) -> std::optional<ServiceConfig> {
        if (errorOut)
            *errorOut = msg;
        return std::nullopt;
    };

    ServiceConfig config;

    bool ok = false;
    const auto portText = parser.value(kPortOption);
    const auto port = portText.toUInt(&ok);
    if (!ok || port == 0 || port > 65535)
        return fail(QString("Invalid port: %1").arg(portText));
    config.port = static_cast<quint16>(port);

    const auto addressText = parser.value(kAddressOption);
    if (!config.address.setAddress(addressText))
        return fail(QString("Invalid address: %1").arg(addressText));

    const auto maxLengthText = parser.value(kMaxLengthOption);
    config.maxPasswordLength = maxLengthText.toInt(&ok);
    if (!ok || config.maxPasswordLength < 1)
        return fail(QString("Invalid max length: %1").arg(maxLengthText));

    config.logFilePath = parser.isSet(kLogFileOption) ? parser.value(kLogFileOption) : AppPaths::defaultLogFilePath();

    return config;
}

} // namespace ServiceOptions
