#include "CommandLine.hpp"
#include "Logger.hpp"
#include <QCommandLineOption>

namespace usb_handshake {

void addLoggingOptions(QCommandLineParser& parser) {
    QCommandLineOption logFileOption(
        QStringList() << "l" << "log-file",
        "Also write log messages to this file and to syslog.",
        "log-file"
    );
    parser.addOption(logFileOption);

    QCommandLineOption logLevelOption(
        QStringList() << "v" << "verbosity",
        "Set log level (0-4: debug, info, warning, error, critical).",
        "level"
    );
    parser.addOption(logLevelOption);
}

void initializeLogger(const QCommandLineParser& parser, int defaultVerbosity) {
    auto& logger = Logger::instance();

    if (parser.isSet("log-file")) {
        logger.setLogFile(parser.value("log-file").toStdString());
        logger.setLogDestination(LogDestination::All);
    }

    int level = defaultVerbosity;
    if (parser.isSet("verbosity")) {
        bool ok = false;
        level = parser.value("verbosity").toInt(&ok);
        if (!ok) {
            level = defaultVerbosity;
        }
    }
    logger.setLogLevel(logLevelFromVerbosity(level));
}

}
