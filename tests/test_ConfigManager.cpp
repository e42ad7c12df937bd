// tests/test_ConfigManager.cpp
#include "TestSupport.hpp"
#include "utils/ConfigManager.hpp"
#include <tray-notifier/Constants.hpp>
#include <QFile>

namespace tray_notifier {
namespace testing {

class ConfigManagerTest : public QtAppTest {
protected:
    QString writeConfig(const QByteArray& json) {
        const QString path = dir.filePath("config.json");
        QFile file(path);
        EXPECT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(json);
        return path;
    }

    QTemporaryDir dir;
    ConfigManager config;
};

TEST_F(ConfigManagerTest, DefaultsMatchBuiltInValues) {
    NotifierConfig nc = config.notifierConfig();

    EXPECT_EQ(nc.port, 8811);
    EXPECT_EQ(nc.defaultIcon, "sun");
    EXPECT_EQ(nc.soundProperty, "win.sound.asterisk");
    EXPECT_EQ(nc.bindAddress, DEFAULT_BIND_ADDRESS);
    EXPECT_EQ(nc.iconRoot, ":/icons");
    EXPECT_EQ(nc.workerThreads, DEFAULT_WORKER_THREADS);
    EXPECT_EQ(nc.stopGracePeriod.count(), STOP_GRACE_PERIOD);
}

TEST_F(ConfigManagerTest, LoadsGlobalSettingsFromFile) {
    const QString path = writeConfig(R"({
        "global": {
            "port": 9000,
            "defaultIcon": "moon",
            "soundProperty": "qt.beep",
            "stopGracePeriodMs": 250
        }
    })");

    ASSERT_TRUE(config.loadFromFile(path.toStdString()));
    NotifierConfig nc = config.notifierConfig();

    EXPECT_EQ(nc.port, 9000);
    EXPECT_EQ(nc.defaultIcon, "moon");
    EXPECT_EQ(nc.soundProperty, "qt.beep");
    EXPECT_EQ(nc.stopGracePeriod.count(), 250);
    EXPECT_EQ(nc.bindAddress, DEFAULT_BIND_ADDRESS);
}

TEST_F(ConfigManagerTest, IgnoresUnsupportedValueTypes) {
    const QString path = writeConfig(R"({
        "global": {
            "port": true,
            "workerThreads": 2.5,
            "defaultIcon": ["sun"],
            "logMaxFileSize": 4096
        }
    })");

    ASSERT_TRUE(config.loadFromFile(path.toStdString()));
    EXPECT_EQ(config.getInt("port"), DEFAULT_PORT);
    EXPECT_EQ(config.getInt("workerThreads"), DEFAULT_WORKER_THREADS);
    EXPECT_EQ(config.getString("defaultIcon"), DEFAULT_ICON);
    EXPECT_EQ(config.getInt("logMaxFileSize"), 4096);

    config.resetToDefaults();
    EXPECT_EQ(config.getInt("logMaxFileSize"), DEFAULT_LOG_MAX_FILE_SIZE);
}

TEST_F(ConfigManagerTest, RejectsMissingOrInvalidFile) {
    EXPECT_FALSE(config.loadFromFile(dir.filePath("absent.json").toStdString()));
    EXPECT_FALSE(config.loadFromFile(writeConfig("{ not json").toStdString()));
    EXPECT_EQ(config.notifierConfig().port, DEFAULT_PORT);
}

TEST_F(ConfigManagerTest, InvalidValuesFallBackToDefaults) {
    config.setInt("port", 0);
    config.setString("defaultIcon", "");
    config.setString("soundProperty", "");
    config.setInt("workerThreads", -1);

    NotifierConfig nc = config.notifierConfig();
    EXPECT_EQ(nc.port, DEFAULT_PORT);
    EXPECT_EQ(nc.defaultIcon, DEFAULT_ICON);
    EXPECT_EQ(nc.soundProperty, DEFAULT_SOUND_PROPERTY);
    EXPECT_EQ(nc.workerThreads, DEFAULT_WORKER_THREADS);

    EXPECT_EQ(NotifierConfig::make(70000).port, DEFAULT_PORT);
    EXPECT_EQ(NotifierConfig::make(8899).port, 8899);
}

TEST_F(ConfigManagerTest, SaveAndReload) {
    config.setInt("port", 8899);
    config.setString("defaultIcon", "storm");
    const std::string path = dir.filePath("saved.json").toStdString();
    ASSERT_TRUE(config.saveToFile(path));

    ConfigManager reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(path));
    EXPECT_EQ(reloaded.getInt("port"), 8899);
    EXPECT_EQ(reloaded.getString("defaultIcon"), "storm");
}

TEST_F(ConfigManagerTest, TypedAccessorsRespectStoredType) {
    config.setString("name", "value");
    EXPECT_EQ(config.getInt("name", 7), 7);
    EXPECT_EQ(config.getString("name"), "value");
    EXPECT_TRUE(config.contains("name"));
    EXPECT_FALSE(config.contains("other"));

    config.resetToDefaults();
    EXPECT_FALSE(config.contains("name"));
}

} // namespace testing
} // namespace tray_notifier
