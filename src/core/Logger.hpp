#pragma once
#include <QObject>
#include <string>
#include <memory>
#include <chrono>

namespace usb_handshake {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

enum class LogDestination {
    Console,
    File,
    System,
    All
};

// Maps the -v/--verbosity command line value (0-4) to a level.
LogLevel logLevelFromVerbosity(int verbosity);

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Configuration
    void setLogLevel(LogLevel level);
    void setLogDestination(LogDestination dest);
    void setLogFile(const std::string& filename);

    // Logging methods
    void debug(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void info(const std::string& message,
             const std::string& source = "",
             const std::string& function = "");
    void warning(const std::string& message,
                const std::string& source = "",
                const std::string& function = "");
    void error(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void critical(const std::string& message,
                 const std::string& source = "",
                 const std::string& function = "");

signals:
    void logAdded(LogLevel level, const std::string& message);
    void logFileRotated(const std::string& oldFile, const std::string& newFile);

private:
    Logger();
    ~Logger();

    void log(LogLevel level,
             const std::string& message,
             const std::string& source = "",
             const std::string& function = "");
    std::string formatLogMessage(LogLevel level,
                               const std::string& message,
                               const std::string& source,
                               const std::string& function) const;
    std::string getLevelString(LogLevel level) const;

    class Private;
    std::unique_ptr<Private> d;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) \
    ::usb_handshake::Logger::instance().debug(msg, __FILE__, __FUNCTION__)
#define LOG_INFO(msg) \
    ::usb_handshake::Logger::instance().info(msg, __FILE__, __FUNCTION__)
#define LOG_WARNING(msg) \
    ::usb_handshake::Logger::instance().warning(msg, __FILE__, __FUNCTION__)
#define LOG_ERROR(msg) \
    ::usb_handshake::Logger::instance().error(msg, __FILE__, __FUNCTION__)
#define LOG_CRITICAL(msg) \
    ::usb_handshake::Logger::instance().critical(msg, __FILE__, __FUNCTION__)

} // namespace usb_handshake
