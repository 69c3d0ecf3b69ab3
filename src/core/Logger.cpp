#include "Logger.hpp"
#include <QtGlobal>
#include <mutex>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef Q_OS_UNIX
#include <syslog.h>
#endif

namespace usb_handshake {

LogLevel logLevelFromVerbosity(int verbosity) {
    switch (verbosity) {
        case 0: return LogLevel::Debug;
        case 1: return LogLevel::Info;
        case 2: return LogLevel::Warning;
        case 3: return LogLevel::Error;
        case 4: return LogLevel::Critical;
        default: return LogLevel::Info;
    }
}

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    size_t maxFileSize{10 * 1024 * 1024}; // 10MB default
    std::chrono::hours maxLogAge{24 * 7};  // 1 week default
    bool includeTimestamps{true};
    bool includeSourceInfo{true};

    mutable std::mutex logMutex;
    std::unique_ptr<std::ofstream> fileStream;

    void openLogFile() {
        if (!logFile.empty()) {
            fileStream = std::make_unique<std::ofstream>(
                logFile, std::ios::app);
        }
    }

    void closeLogFile() {
        if (fileStream) {
            fileStream->close();
            fileStream.reset();
        }
    }

    // stdout belongs to the tools' reports
    void writeToConsole(const std::string& formattedMessage) {
        std::cerr << formattedMessage << std::endl;
    }

    void writeToFile(const std::string& formattedMessage) {
        if (!fileStream || !fileStream->is_open()) {
            openLogFile();
        }

        if (fileStream && fileStream->is_open()) {
            (*fileStream) << formattedMessage << std::endl;
            fileStream->flush();
        }
    }

    void writeToSystem(LogLevel level, const std::string& formattedMessage) {
#ifdef Q_OS_UNIX
        int priority = LOG_INFO;
        switch (level) {
            case LogLevel::Debug:    priority = LOG_DEBUG; break;
            case LogLevel::Info:     priority = LOG_INFO; break;
            case LogLevel::Warning:  priority = LOG_WARNING; break;
            case LogLevel::Error:    priority = LOG_ERR; break;
            case LogLevel::Critical: priority = LOG_CRIT; break;
        }
        syslog(priority, "%s", formattedMessage.c_str());
#else
        Q_UNUSED(level);
        Q_UNUSED(formattedMessage);
#endif
    }

    bool shouldRotateLogFile() {
        std::error_code ec;
        if (logFile.empty() || !std::filesystem::exists(logFile, ec)) {
            return false;
        }

        auto fileSize = std::filesystem::file_size(logFile, ec);
        if (!ec && fileSize >= maxFileSize) {
            return true;
        }

        auto lastWrite = std::filesystem::last_write_time(logFile, ec);
        if (ec) {
            return false;
        }
        auto now = std::filesystem::file_time_type::clock::now();
        auto age = std::chrono::duration_cast<std::chrono::hours>(
            now - lastWrite);

        return age >= maxLogAge;
    }

    // Returns the rotated file name, empty if the rename failed.
    std::string rotateLogFile(const std::string& oldFile) {
        closeLogFile();

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&time), "%Y%m%d_%H%M%S");

        std::string newFile = oldFile + "." + ss.str();

        std::error_code ec;
        std::filesystem::rename(oldFile, newFile, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
            newFile.clear();
        }

        openLogFile();
        return newFile;
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
}

Logger::~Logger() = default;

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->currentLevel = level;
}

void Logger::setLogDestination(LogDestination dest) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->destination = dest;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->closeLogFile();
    d->logFile = filename;
    d->openLogFile();
}

void Logger::debug(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Debug, message, source, function);
}

void Logger::info(const std::string& message,
                 const std::string& source,
                 const std::string& function) {
    log(LogLevel::Info, message, source, function);
}

void Logger::warning(const std::string& message,
                    const std::string& source,
                    const std::string& function) {
    log(LogLevel::Warning, message, source, function);
}

void Logger::error(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Error, message, source, function);
}

void Logger::critical(const std::string& message,
                     const std::string& source,
                     const std::string& function) {
    log(LogLevel::Critical, message, source, function);
}

void Logger::log(LogLevel level,
                const std::string& message,
                const std::string& source,
                const std::string& function) {
    std::string rotatedFrom;
    std::string rotatedTo;
    {
        std::lock_guard<std::mutex> lock(d->logMutex);

        if (level < d->currentLevel) {
            return;
        }

        std::string formattedMessage = formatLogMessage(
            level, message, source, function);

        if (d->destination == LogDestination::Console ||
            d->destination == LogDestination::All) {
            d->writeToConsole(formattedMessage);
        }

        if (d->destination == LogDestination::File ||
            d->destination == LogDestination::All) {
            if (d->shouldRotateLogFile()) {
                rotatedFrom = d->logFile;
                rotatedTo = d->rotateLogFile(d->logFile);
            }
            d->writeToFile(formattedMessage);
        }

        if (d->destination == LogDestination::System ||
            d->destination == LogDestination::All) {
            d->writeToSystem(level, formattedMessage);
        }
    }

    // Signals go out unlocked so slots may log themselves.
    if (!rotatedTo.empty()) {
        emit logFileRotated(rotatedFrom, rotatedTo);
    }
    emit logAdded(level, message);
}

std::string Logger::formatLogMessage(LogLevel level,
                                   const std::string& message,
                                   const std::string& source,
                                   const std::string& function) const {
    std::stringstream ss;

    if (d->includeTimestamps) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << " ";
    }

    ss << "[" << getLevelString(level) << "] ";

    if (d->includeSourceInfo && !source.empty()) {
        ss << std::filesystem::path(source).filename().string();
        if (!function.empty()) {
            ss << ":" << function;
        }
        ss << " - ";
    }

    ss << message;
    return ss.str();
}

std::string Logger::getLevelString(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

} // namespace usb_handshake
