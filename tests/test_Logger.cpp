// tests/test_Logger.cpp
#include <gtest/gtest.h>
#include "Logger.hpp"
#include <QFile>
#include <QTemporaryDir>

namespace usb_handshake {
namespace testing {

TEST(LoggerTest, VerbosityMapping) {
    EXPECT_EQ(logLevelFromVerbosity(0), LogLevel::Debug);
    EXPECT_EQ(logLevelFromVerbosity(2), LogLevel::Warning);
    EXPECT_EQ(logLevelFromVerbosity(4), LogLevel::Critical);
    EXPECT_EQ(logLevelFromVerbosity(9), LogLevel::Info);
}

TEST(LoggerTest, FileDestinationHonoursLevel) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("capture.log");

    auto& logger = Logger::instance();
    logger.setLogFile(path.toStdString());
    logger.setLogDestination(LogDestination::File);
    logger.setLogLevel(LogLevel::Warning);

    LOG_INFO("device enumerated");
    LOG_WARNING("backend unavailable");

    logger.setLogFile("");
    logger.setLogDestination(LogDestination::Console);
    logger.setLogLevel(LogLevel::Info);

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    const QByteArray contents = file.readAll();
    EXPECT_TRUE(contents.contains("[WARNING] test_Logger.cpp:"));
    EXPECT_TRUE(contents.contains("backend unavailable"));
    EXPECT_FALSE(contents.contains("device enumerated"));
}

} // namespace testing
} // namespace usb_handshake
