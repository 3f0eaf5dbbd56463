#pragma once

#include <string>
#include <functional>
#include <optional>
#include <vector>
#include <memory>
#include <mutex>
#include <yaml-cpp/yaml.h>
#include "core/generation_settings.hpp"
#include "core/image_resolver.hpp"
#include "core/remote_generation_client.hpp"
#include "core/text_enhancer.hpp"

/**
 * @brief Configuration change event types
 */
enum class ConfigEventType
{
    LOG_LEVEL_CHANGED,
    SERVER_PORT_CHANGED,
    GENERAL_CONFIG_CHANGED
};

/**
 * @brief Configuration change event
 */
struct ConfigEvent
{
    ConfigEventType type;
    std::string key;
    YAML::Node old_value;
    YAML::Node new_value;
    std::string description;
};

/**
 * @brief Observer interface for configuration changes
 */
class ConfigObserver
{
public:
    virtual ~ConfigObserver() = default;
    virtual void onConfigChanged(const ConfigEvent &event) = 0;
};

/**
 * @brief Server configuration manager with reactive publishing
 *
 * Defaults are embedded; loadConfig() replaces them with a validated file.
 * Typed getters fall back to the default value, with a warning, when a key
 * is missing or out of range.
 */
class ServerConfigManager
{
public:
    // Singleton pattern
    static ServerConfigManager &getInstance();

    // Configuration getters
    std::string getLogLevel() const;
    int getServerPort() const;
    std::string getServerHost() const;

    // Generation pipeline configuration
    GenerationSettings getGenerationSettings() const;
    StorageSettings getStorageSettings() const;
    RemoteGenerationSettings getRemoteGenerationSettings() const;
    TextEnhancementSettings getTextEnhancementSettings() const;

    // Overrides the detected host memory when set (environment.memory_gb_override)
    std::optional<double> getMemoryOverrideGb() const;

    // Configuration setters with event publishing
    void setLogLevel(const std::string &level);
    // persist=false applies the port for this process only (command-line override)
    void setServerPort(int port, bool persist = true);
    void updateConfig(const YAML::Node &new_config);

    // Restore the embedded defaults without touching any file
    void resetToDefaults();

    // Observer management
    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

    // Configuration persistence
    bool loadConfig(const std::string &file_path);
    bool saveConfig(const std::string &file_path) const;

    // Configuration validation
    bool validateConfig(const YAML::Node &config) const;

private:
    ServerConfigManager();
    ~ServerConfigManager() = default;
    ServerConfigManager(const ServerConfigManager &) = delete;
    ServerConfigManager &operator=(const ServerConfigManager &) = delete;

    // Internal methods
    void publishEvent(const ConfigEvent &event);
    void initializeDefaultConfig();
    bool saveConfigInternal(const std::string &file_path, const YAML::Node &config) const;

    template <typename T>
    T readValue(const std::string &section, const std::string &key, const T &fallback) const;

    // Configuration storage
    mutable std::mutex config_mutex_;
    YAML::Node config_;
    std::string config_path_; // File changes are persisted to; empty until loadConfig()

    // Observers
    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;
};
