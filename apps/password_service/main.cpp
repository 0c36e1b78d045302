#include "core/logging.h"
#include "service/passwordservice.h"
#include "service/serviceconfig.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QtDebug>

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName("CourseDesign");
    QCoreApplication::setApplicationName("PasswordService");
    QCoreApplication::setApplicationVersion("1.0");

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription("Generates random passwords over a JSON HTTP API.");
    parser.addHelpOption();
    parser.addVersionOption();
    ServiceOptions::addOptions(parser);
    parser.process(app);

    QString error;
    const auto config = ServiceOptions::configFromParser(parser, &error);
    if (!config) {
        qCritical().noquote() << error;
        return 1;
    }

    Logging::init(config->logFilePath);

    PasswordService service(*config);
    if (!service.start(&error)) {
        qCritical().noquote() << error;
        return 1;
    }

    return app.exec();
}
