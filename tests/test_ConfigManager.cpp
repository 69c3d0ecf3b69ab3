// tests/test_ConfigManager.cpp
#include <gtest/gtest.h>
#include "ConfigManager.hpp"
#include <usb-handshake/Constants.hpp>
#include <QFile>
#include <QTemporaryDir>

namespace usb_handshake {
namespace testing {

class ConfigManagerTest : public ::testing::Test {
protected:
    std::string writeConfig(const QByteArray& contents) {
        QString path = dir.filePath("config.json");
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.write(contents);
        }
        return path.toStdString();
    }

    QTemporaryDir dir;
    ConfigManager config;
};

TEST_F(ConfigManagerTest, Defaults) {
    EXPECT_EQ(config.getInt("pollInterval"), POLLING_INTERVAL);
    EXPECT_EQ(config.getString("handshakeFile"), DEFAULT_HANDSHAKE_FILE);
    EXPECT_EQ(config.getString("backendFailurePolicy"), "retry");
    EXPECT_EQ(config.getInt("maxBackendFailures", -1), 0);
    EXPECT_EQ(config.getInt("logLevel"), 1);
}

TEST_F(ConfigManagerTest, LoadsGlobalSettings) {
    std::string path = writeConfig(R"({"global": {
        "pollInterval": 250,
        "handshakeFile": "/var/log/usb_handshake.json",
        "backendFailurePolicy": "abort"
    }})");

    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_EQ(config.getInt("pollInterval"), 250);
    EXPECT_EQ(config.getString("handshakeFile"), "/var/log/usb_handshake.json");
    EXPECT_EQ(config.getString("backendFailurePolicy"), "abort");
    EXPECT_EQ(config.getInt("maxBackendFailures", -1), 0);
}

TEST_F(ConfigManagerTest, IgnoresMistypedAndUnknownSettings) {
    std::string path = writeConfig(R"({"global": {
        "pollInterval": "fast",
        "maxBackendFailures": 2.5,
        "colour": "blue"
    }})");

    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_EQ(config.getInt("pollInterval"), POLLING_INTERVAL);
    EXPECT_EQ(config.getInt("maxBackendFailures", -1), 0);
    EXPECT_EQ(config.getString("colour", "none"), "none");
}

TEST_F(ConfigManagerTest, RejectsUnreadableFiles) {
    EXPECT_FALSE(config.loadFromFile(dir.filePath("absent.json").toStdString()));
    EXPECT_FALSE(config.loadFromFile(writeConfig("[1, 2, 3]")));
    EXPECT_FALSE(config.loadFromFile(writeConfig("{broken")));
}

TEST_F(ConfigManagerTest, SettersOverrideValues) {
    config.setInt("pollInterval", 5000);
    config.setString("backendFailurePolicy", "abort");

    EXPECT_EQ(config.getInt("pollInterval"), 5000);
    EXPECT_EQ(config.getString("backendFailurePolicy"), "abort");
    EXPECT_EQ(config.getString("pollInterval", "n/a"), "n/a");
}

TEST_F(ConfigManagerTest, SavedConfigurationLoadsBack) {
    config.setInt("pollInterval", 250);
    config.setString("backendFailurePolicy", "abort");
    config.setInt("maxBackendFailures", 3);

    std::string path = dir.filePath("saved.json").toStdString();
    ASSERT_TRUE(config.saveToFile(path));

    ConfigManager restored;
    ASSERT_TRUE(restored.loadFromFile(path));
    EXPECT_EQ(restored.getInt("pollInterval"), 250);
    EXPECT_EQ(restored.getString("backendFailurePolicy"), "abort");
    EXPECT_EQ(restored.getInt("maxBackendFailures", -1), 3);
    EXPECT_EQ(restored.getString("handshakeFile"), DEFAULT_HANDSHAKE_FILE);
}

TEST_F(ConfigManagerTest, SaveFailsForUnwritablePath) {
    EXPECT_FALSE(config.saveToFile(dir.filePath("missing/dir/config.json").toStdString()));
}

} // namespace testing
} // namespace usb_handshake
