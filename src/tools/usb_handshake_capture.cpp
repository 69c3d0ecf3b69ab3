#include "core/HandshakeLog.hpp"
#include "core/HandshakeMonitor.hpp"
#include "core/LibusbEnumerator.hpp"
#include "core/Logger.hpp"
#include "utils/CommandLine.hpp"
#include "utils/ConfigManager.hpp"
#include <usb-handshake/Constants.hpp>
#include <usb-handshake/Errors.hpp>
#include <QCoreApplication>
#include <QCommandLineOption>
#include <QDir>
#include <QFile>
#include <QTimer>
#include <csignal>
#include <iostream>

using namespace usb_handshake;

namespace {

volatile std::sig_atomic_t stopRequested = 0;

void requestStop(int) {
    stopRequested = 1;
}

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription(
        "Records the descriptors of newly connected USB devices in a JSON log.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Specify configuration file path.",
        "config"
    );
    parser.addOption(configOption);

    QCommandLineOption outputOption(
        QStringList() << "o" << "output",
        "Handshake log to append to (default: usb_handshake.json).",
        "file"
    );
    parser.addOption(outputOption);

    QCommandLineOption intervalOption(
        QStringList() << "i" << "interval",
        "Polling interval in milliseconds.",
        "ms"
    );
    parser.addOption(intervalOption);

    QCommandLineOption abortOption(
        "abort-on-backend-error",
        "Stop with exit code 2 the first time the USB backend is unavailable."
    );
    parser.addOption(abortOption);

    QCommandLineOption writeConfigOption(
        "write-config",
        "Write the effective configuration to a file and exit.",
        "file"
    );
    parser.addOption(writeConfigOption);

    addLoggingOptions(parser);
}

bool loadConfiguration(ConfigManager& config, const QCommandLineParser& parser) {
    QString configPath;

    if (parser.isSet("config")) {
        configPath = parser.value("config");
    } else {
        QStringList configLocations = {
            QDir::currentPath() + "/usb-handshake-config.json",
            QDir::homePath() + "/.config/usb-handshake/config.json",
            "/etc/usb-handshake/config.json"
        };

        for (const auto& path : configLocations) {
            if (QFile::exists(path)) {
                configPath = path;
                break;
            }
        }
    }

    if (!configPath.isEmpty()) {
        if (!config.loadFromFile(configPath.toStdString())) {
            LOG_CRITICAL("Failed to load configuration from " + configPath.toStdString());
            return false;
        }
        LOG_INFO("Loaded configuration from " + configPath.toStdString());
        return true;
    }

    LOG_DEBUG("No configuration file found, using defaults");
    return true;
}

bool applyOverrides(ConfigManager& config, const QCommandLineParser& parser) {
    if (parser.isSet("output")) {
        config.setString("handshakeFile", parser.value("output").toStdString());
    }
    if (parser.isSet("interval")) {
        bool ok = false;
        int interval = parser.value("interval").toInt(&ok);
        if (!ok) {
            LOG_CRITICAL("Invalid polling interval: " + parser.value("interval").toStdString());
            return false;
        }
        config.setInt("pollInterval", interval);
    }
    if (parser.isSet("abort-on-backend-error")) {
        config.setString("backendFailurePolicy", "abort");
    }
    return true;
}

std::optional<MonitorSettings> monitorSettingsFrom(const ConfigManager& config) {
    MonitorSettings settings;

    int interval = config.getInt("pollInterval", POLLING_INTERVAL);
    if (interval <= 0) {
        LOG_CRITICAL("pollInterval must be positive, got " + std::to_string(interval));
        return std::nullopt;
    }
    settings.interval = std::chrono::milliseconds(interval);

    std::string policyName = config.getString("backendFailurePolicy", "retry");
    auto policy = backendFailurePolicyFromString(policyName);
    if (!policy) {
        LOG_CRITICAL("backendFailurePolicy must be 'retry' or 'abort', got '" +
                     policyName + "'");
        return std::nullopt;
    }
    settings.backendFailurePolicy = *policy;

    settings.maxBackendFailures = config.getInt("maxBackendFailures", 0);
    if (settings.maxBackendFailures < 0) {
        LOG_CRITICAL("maxBackendFailures must not be negative");
        return std::nullopt;
    }

    return settings;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("usb-handshake-capture");
    app.setApplicationVersion(APPLICATION_VERSION);

    QCommandLineParser parser;
    setupCommandLineParser(parser);
    parser.process(app);

    initializeLogger(parser, 1);

    try {
        ConfigManager config;
        if (!loadConfiguration(config, parser) || !applyOverrides(config, parser)) {
            return ExitCodes::FAILURE;
        }
        if (!parser.isSet("verbosity")) {
            Logger::instance().setLogLevel(logLevelFromVerbosity(config.getInt("logLevel", 1)));
        }

        auto settings = monitorSettingsFrom(config);
        if (!settings) {
            return ExitCodes::FAILURE;
        }

        if (parser.isSet("write-config")) {
            std::string target = parser.value("write-config").toStdString();
            if (!config.saveToFile(target)) {
                LOG_CRITICAL("Failed to write configuration to " + target);
                return ExitCodes::FAILURE;
            }
            LOG_INFO("Configuration written to " + target);
            return ExitCodes::SUCCESS;
        }

        std::cout << "Starting USB handshake capture..." << std::endl;

        LibusbEnumerator enumerator;
        HandshakeLog log(config.getString("handshakeFile", DEFAULT_HANDSHAKE_FILE));
        HandshakeMonitor monitor(enumerator, log, *settings);

        QObject::connect(&monitor, &HandshakeMonitor::finished,
                         &app, [](int exitCode) { QCoreApplication::exit(exitCode); });

        std::signal(SIGINT, requestStop);
        std::signal(SIGTERM, requestStop);

        // Signal handlers only set a flag; the event loop acts on it between ticks.
        QTimer stopWatcher;
        QObject::connect(&stopWatcher, &QTimer::timeout, &monitor, [&monitor]() {
            if (stopRequested) {
                monitor.stop(ExitCodes::SUCCESS);
            }
        });
        stopWatcher.start(100);

        std::cout << "Monitoring USB ports... Press Ctrl+C to stop." << std::endl;
        monitor.start();

        return app.exec();

    } catch (const BackendUnavailable& e) {
        std::cerr << "USB backend unavailable: " << e.what() << std::endl;
        LOG_CRITICAL("USB backend unavailable: " + std::string(e.what()));
        return ExitCodes::FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return ExitCodes::FAILURE;
    }
}
