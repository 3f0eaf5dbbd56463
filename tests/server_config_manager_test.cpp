#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "core/logger_observer.hpp"
#include "core/server_config_manager.hpp"
#include "logging/logger.hpp"

namespace fs = std::filesystem;

class RecordingObserver : public ConfigObserver
{
public:
    std::vector<ConfigEvent> events;

    void onConfigChanged(const ConfigEvent &event) override
    {
        events.push_back(event);
    }
};

class ServerConfigManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ServerConfigManager::getInstance().resetToDefaults();
        dir = fs::temp_directory_path() / ("docgen_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                                           "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir);
    }

    void TearDown() override
    {
        ServerConfigManager::getInstance().resetToDefaults();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string writeConfig(const std::string &name, const std::string &yaml)
    {
        const fs::path path = dir / name;
        std::ofstream file(path);
        file << yaml;
        return path.string();
    }

    fs::path dir;
};

TEST_F(ServerConfigManagerTest, DefaultsMatchGenerationSettings)
{
    auto &config = ServerConfigManager::getInstance();
    GenerationSettings settings = config.getGenerationSettings();

    EXPECT_EQ(config.getServerPort(), 8080);
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(settings.batch_size, 3);
    EXPECT_EQ(settings.max_embed_size_bytes, 2 * MIB);
    EXPECT_EQ(settings.max_image_width, 800);
    EXPECT_EQ(settings.max_image_height, 600);
    EXPECT_EQ(settings.max_package_bytes, 50 * MIB);
    EXPECT_EQ(settings.local_payload_ceiling_bytes, 40 * MIB);
    EXPECT_DOUBLE_EQ(settings.low_memory_threshold_gb, 4.0);
    EXPECT_EQ(settings.low_memory_max_images, 10);
    EXPECT_FALSE(config.getMemoryOverrideGb().has_value());
    EXPECT_TRUE(config.getRemoteGenerationSettings().base_url.empty());
    EXPECT_EQ(config.getTextEnhancementSettings().path, "/api/ai/generate-text");
}

TEST_F(ServerConfigManagerTest, LoadMergesFileOverDefaults)
{
    const std::string path = writeConfig("config.yaml", R"(
log_level: DEBUG
server_port: 9090
server_host: 127.0.0.1
generation:
  batch_size: 5
  max_package_bytes: 1048576
environment:
  memory_gb_override: 2.5
remote_generation:
  base_url: https://docs.example.com
)");

    auto &config = ServerConfigManager::getInstance();
    ASSERT_TRUE(config.loadConfig(path));

    GenerationSettings settings = config.getGenerationSettings();
    EXPECT_EQ(config.getServerPort(), 9090);
    EXPECT_EQ(config.getServerHost(), "127.0.0.1");
    EXPECT_EQ(settings.batch_size, 5);
    EXPECT_EQ(settings.max_package_bytes, 1048576u);
    EXPECT_EQ(settings.max_image_width, 800);
    ASSERT_TRUE(config.getMemoryOverrideGb().has_value());
    EXPECT_DOUBLE_EQ(*config.getMemoryOverrideGb(), 2.5);

    RemoteGenerationSettings remote = config.getRemoteGenerationSettings();
    EXPECT_EQ(remote.base_url, "https://docs.example.com");
    EXPECT_EQ(remote.path, "/api/reports/generate-word");

    Logger::setLevel("INFO");
}

TEST_F(ServerConfigManagerTest, InvalidFilesAreRejected)
{
    auto &config = ServerConfigManager::getInstance();

    EXPECT_FALSE(config.loadConfig(writeConfig("no_port.yaml", "log_level: INFO\nserver_host: 0.0.0.0\n")));
    EXPECT_FALSE(config.loadConfig(writeConfig("bad_port.yaml", "log_level: INFO\nserver_port: 70000\nserver_host: 0.0.0.0\n")));
    EXPECT_FALSE(config.loadConfig(writeConfig("bad_level.yaml", "log_level: LOUD\nserver_port: 80\nserver_host: 0.0.0.0\n")));
    EXPECT_FALSE(config.loadConfig(writeConfig("bad_quality.yaml",
                                               "log_level: INFO\nserver_port: 80\nserver_host: 0.0.0.0\n"
                                               "generation:\n  jpeg_quality: 0\n")));
    EXPECT_FALSE(config.loadConfig(writeConfig("bad_batch.yaml",
                                               "log_level: INFO\nserver_port: 80\nserver_host: 0.0.0.0\n"
                                               "generation:\n  batch_size: -1\n")));
    EXPECT_FALSE(config.loadConfig((dir / "missing.yaml").string()));

    // A rejected file leaves the previous configuration in place
    EXPECT_EQ(config.getServerPort(), 8080);
}

TEST_F(ServerConfigManagerTest, SaveAndReloadRoundTrip)
{
    auto &config = ServerConfigManager::getInstance();
    const std::string path = (dir / "saved.yaml").string();

    config.setServerPort(8181);
    ASSERT_TRUE(config.saveConfig(path));
    config.resetToDefaults();
    EXPECT_EQ(config.getServerPort(), 8080);

    ASSERT_TRUE(config.loadConfig(path));
    EXPECT_EQ(config.getServerPort(), 8181);
}

TEST_F(ServerConfigManagerTest, TransientPortOverrideIsNotSaved)
{
    auto &config = ServerConfigManager::getInstance();
    const std::string path = writeConfig("config.yaml", "log_level: INFO\nserver_port: 8081\nserver_host: 0.0.0.0\n");
    ASSERT_TRUE(config.loadConfig(path));

    config.setServerPort(9191, false);
    EXPECT_EQ(config.getServerPort(), 9191);
    EXPECT_EQ(YAML::LoadFile(path)["server_port"].as<int>(), 8081);

    config.setServerPort(9292);
    EXPECT_EQ(YAML::LoadFile(path)["server_port"].as<int>(), 9292);
}

TEST_F(ServerConfigManagerTest, ChangesArePublishedToObservers)
{
    auto &config = ServerConfigManager::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    config.setServerPort(8282);
    config.setServerPort(8282);
    YAML::Node update;
    update["generation"]["batch_size"] = 7;
    config.updateConfig(update);

    config.unsubscribe(&observer);
    config.setServerPort(8383);

    ASSERT_EQ(observer.events.size(), 2u);
    EXPECT_EQ(observer.events[0].type, ConfigEventType::SERVER_PORT_CHANGED);
    EXPECT_EQ(observer.events[0].new_value.as<int>(), 8282);
    EXPECT_EQ(observer.events[1].type, ConfigEventType::GENERAL_CONFIG_CHANGED);
    EXPECT_EQ(observer.events[1].key, "generation");
    EXPECT_EQ(config.getGenerationSettings().batch_size, 7);
}

TEST_F(ServerConfigManagerTest, LoggerObserverFollowsLogLevel)
{
    auto &config = ServerConfigManager::getInstance();
    LoggerObserver logger_observer;
    RecordingObserver recorder;
    config.subscribe(&logger_observer);
    config.subscribe(&recorder);

    config.setLogLevel("DEBUG");
    config.setLogLevel("INFO");

    config.unsubscribe(&recorder);
    config.unsubscribe(&logger_observer);

    ASSERT_EQ(recorder.events.size(), 2u);
    EXPECT_EQ(recorder.events[0].type, ConfigEventType::LOG_LEVEL_CHANGED);
    EXPECT_EQ(recorder.events[1].new_value.as<std::string>(), "INFO");
    EXPECT_EQ(config.getLogLevel(), "INFO");
}

TEST_F(ServerConfigManagerTest, OutOfRangeGenerationValuesFallBack)
{
    auto &config = ServerConfigManager::getInstance();
    YAML::Node update;
    update["generation"]["batch_size"] = 0;
    update["generation"]["jpeg_quality"] = 150;
    config.updateConfig(update);

    GenerationSettings settings = config.getGenerationSettings();
    EXPECT_EQ(settings.batch_size, 3);
    EXPECT_EQ(settings.jpeg_quality, 85);
}
