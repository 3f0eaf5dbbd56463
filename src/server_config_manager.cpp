#include "core/server_config_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <fstream>

namespace
{
    const char *DEFAULT_CONFIG = R"(
        log_level: "INFO"
        server_port: 8080
        server_host: "0.0.0.0"
        generation:
          batch_size: 3
          inter_batch_delay_ms: 100
          max_embed_size_bytes: 2097152
          max_image_width: 800
          max_image_height: 600
          jpeg_quality: 85
          max_package_bytes: 52428800
          local_payload_ceiling_bytes: 41943040
          low_memory_threshold_gb: 4.0
          low_memory_max_images: 10
        environment:
          memory_gb_override: ~
        storage:
          base_url: ""
          connect_timeout_seconds: 10
          read_timeout_seconds: 30
          max_download_bytes: 10485760
        remote_generation:
          base_url: ""
          path: "/api/reports/generate-word"
          timeout_seconds: 120
        text_enhancement:
          base_url: ""
          path: "/api/ai/generate-text"
          timeout_seconds: 30
    )";

    bool positiveIfPresent(const YAML::Node &section, const char *key)
    {
        if (!section || !section[key] || section[key].IsNull())
            return true;
        // Non-numeric values throw and are reported by validateConfig
        if (section[key].as<double>() > 0)
            return true;
        Logger::error(std::string("Config value must be a positive number: ") + key);
        return false;
    }
}

ServerConfigManager::ServerConfigManager()
{
    initializeDefaultConfig();
}

ServerConfigManager &ServerConfigManager::getInstance()
{
    static ServerConfigManager instance;
    return instance;
}

void ServerConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = YAML::Load(DEFAULT_CONFIG);
}

void ServerConfigManager::resetToDefaults()
{
    initializeDefaultConfig();
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_path_.clear();
}

template <typename T>
T ServerConfigManager::readValue(const std::string &section, const std::string &key, const T &fallback) const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    try
    {
        const YAML::Node root = config_;
        const YAML::Node scope = section.empty() ? root : root[section];
        if (scope && scope.IsMap())
        {
            const YAML::Node node = scope[key];
            if (node && !node.IsNull())
            {
                return node.as<T>();
            }
        }
    }
    catch (const YAML::Exception &e)
    {
        Logger::warn("Error parsing " + (section.empty() ? key : section + "." + key) + ": " + e.what() +
                     ", using default");
    }
    return fallback;
}

std::string ServerConfigManager::getLogLevel() const
{
    return readValue<std::string>("", "log_level", "INFO");
}

int ServerConfigManager::getServerPort() const
{
    return readValue<int>("", "server_port", 8080);
}

std::string ServerConfigManager::getServerHost() const
{
    return readValue<std::string>("", "server_host", "0.0.0.0");
}

GenerationSettings ServerConfigManager::getGenerationSettings() const
{
    GenerationSettings settings;
    settings.batch_size = readValue<int>("generation", "batch_size", settings.batch_size);
    settings.inter_batch_delay_ms = readValue<int>("generation", "inter_batch_delay_ms", settings.inter_batch_delay_ms);
    settings.max_embed_size_bytes = readValue<uint64_t>("generation", "max_embed_size_bytes", settings.max_embed_size_bytes);
    settings.max_image_width = readValue<int>("generation", "max_image_width", settings.max_image_width);
    settings.max_image_height = readValue<int>("generation", "max_image_height", settings.max_image_height);
    settings.jpeg_quality = readValue<int>("generation", "jpeg_quality", settings.jpeg_quality);
    settings.max_package_bytes = readValue<uint64_t>("generation", "max_package_bytes", settings.max_package_bytes);
    settings.local_payload_ceiling_bytes =
        readValue<uint64_t>("generation", "local_payload_ceiling_bytes", settings.local_payload_ceiling_bytes);
    settings.low_memory_threshold_gb = readValue<double>("generation", "low_memory_threshold_gb", settings.low_memory_threshold_gb);
    settings.low_memory_max_images = readValue<int>("generation", "low_memory_max_images", settings.low_memory_max_images);

    if (settings.batch_size < 1)
    {
        Logger::warn("Invalid generation.batch_size: " + std::to_string(settings.batch_size) + ", using default: 3");
        settings.batch_size = 3;
    }
    if (settings.jpeg_quality < 1 || settings.jpeg_quality > 100)
    {
        Logger::warn("Invalid generation.jpeg_quality: " + std::to_string(settings.jpeg_quality) + ", using default: 85");
        settings.jpeg_quality = 85;
    }
    settings.min_jpeg_quality = std::min(settings.min_jpeg_quality, settings.jpeg_quality);
    return settings;
}

StorageSettings ServerConfigManager::getStorageSettings() const
{
    StorageSettings settings;
    settings.base_url = readValue<std::string>("storage", "base_url", settings.base_url);
    settings.connect_timeout_seconds = readValue<int>("storage", "connect_timeout_seconds", settings.connect_timeout_seconds);
    settings.read_timeout_seconds = readValue<int>("storage", "read_timeout_seconds", settings.read_timeout_seconds);
    settings.max_download_bytes = readValue<uint64_t>("storage", "max_download_bytes", settings.max_download_bytes);
    return settings;
}

RemoteGenerationSettings ServerConfigManager::getRemoteGenerationSettings() const
{
    RemoteGenerationSettings settings;
    settings.base_url = readValue<std::string>("remote_generation", "base_url", settings.base_url);
    settings.path = readValue<std::string>("remote_generation", "path", settings.path);
    settings.timeout_seconds = readValue<int>("remote_generation", "timeout_seconds", settings.timeout_seconds);
    return settings;
}

TextEnhancementSettings ServerConfigManager::getTextEnhancementSettings() const
{
    TextEnhancementSettings settings;
    settings.base_url = readValue<std::string>("text_enhancement", "base_url", settings.base_url);
    settings.path = readValue<std::string>("text_enhancement", "path", settings.path);
    settings.timeout_seconds = readValue<int>("text_enhancement", "timeout_seconds", settings.timeout_seconds);
    return settings;
}

std::optional<double> ServerConfigManager::getMemoryOverrideGb() const
{
    const double value = readValue<double>("environment", "memory_gb_override", -1.0);
    if (value <= 0)
    {
        return std::nullopt;
    }
    return value;
}

void ServerConfigManager::setLogLevel(const std::string &level)
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    std::string old_level = config_["log_level"].as<std::string>();
    if (old_level != level)
    {
        YAML::Node old_value;
        old_value = old_level;
        YAML::Node new_value;
        new_value = level;
        config_["log_level"] = level;
        ConfigEvent event{
            ConfigEventType::LOG_LEVEL_CHANGED,
            "log_level",
            old_value,
            new_value,
            "Log level changed from " + old_level + " to " + level};
        publishEvent(event);
        if (!config_path_.empty())
            saveConfigInternal(config_path_, config_);
    }
}

void ServerConfigManager::setServerPort(int port, bool persist)
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    int old_port = config_["server_port"].as<int>();
    if (old_port != port)
    {
        YAML::Node old_value;
        old_value = old_port;
        YAML::Node new_value;
        new_value = port;
        config_["server_port"] = port;
        ConfigEvent event{
            ConfigEventType::SERVER_PORT_CHANGED,
            "server_port",
            old_value,
            new_value,
            "Server port changed from " + std::to_string(old_port) + " to " + std::to_string(port)};
        publishEvent(event);
        if (persist && !config_path_.empty())
            saveConfigInternal(config_path_, config_);
    }
}

void ServerConfigManager::updateConfig(const YAML::Node &new_config)
{
    // Defer special updates to avoid locking the same mutex inside setters
    bool has_new_log_level = false;
    std::string new_log_level_value;
    bool has_new_server_port = false;
    int new_server_port_value = 0;

    bool config_changed = false;

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        for (auto it = new_config.begin(); it != new_config.end(); ++it)
        {
            const std::string key = it->first.as<std::string>();

            if (key == "log_level")
            {
                try
                {
                    std::string incoming = it->second.as<std::string>();
                    if (config_["log_level"].as<std::string>() != incoming)
                    {
                        new_log_level_value = incoming;
                        has_new_log_level = true;
                    }
                }
                catch (const YAML::Exception &e)
                {
                    Logger::warn("Ignoring invalid log_level update: " + std::string(e.what()));
                }
                continue;
            }
            if (key == "server_port")
            {
                try
                {
                    int incoming = it->second.as<int>();
                    if (config_["server_port"].as<int>() != incoming)
                    {
                        new_server_port_value = incoming;
                        has_new_server_port = true;
                    }
                }
                catch (const YAML::Exception &e)
                {
                    Logger::warn("Ignoring invalid server_port update: " + std::string(e.what()));
                }
                continue;
            }

            // Generic update for all other keys
            YAML::Node old_value = YAML::Clone(config_[key]);
            YAML::Node new_value = YAML::Clone(it->second);
            if (YAML::Dump(old_value) != YAML::Dump(new_value))
            {
                config_[key] = new_value;
                config_changed = true;
                ConfigEvent event{
                    ConfigEventType::GENERAL_CONFIG_CHANGED,
                    key,
                    old_value,
                    new_value,
                    "Configuration key '" + key + "' updated"};
                publishEvent(event);
            }
        }
        if (config_changed && !config_path_.empty())
        {
            saveConfigInternal(config_path_, config_);
        }
    }

    // Apply special keys outside the lock so their setters can lock safely and notify
    if (has_new_log_level)
        setLogLevel(new_log_level_value);
    if (has_new_server_port)
        setServerPort(new_server_port_value);
}

void ServerConfigManager::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.push_back(observer);
    Logger::debug("Configuration observer subscribed");
}

void ServerConfigManager::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
    Logger::debug("Configuration observer unsubscribed");
}

void ServerConfigManager::publishEvent(const ConfigEvent &event)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);

    Logger::info("Publishing config event: " + event.description);
    for (auto observer : observers_)
    {
        try
        {
            observer->onConfigChanged(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in config observer: " + std::string(e.what()));
        }
    }
}

bool ServerConfigManager::loadConfig(const std::string &file_path)
{
    try
    {
        YAML::Node loaded = YAML::LoadFile(file_path);
        if (!validateConfig(loaded))
        {
            Logger::error("Invalid configuration in file: " + file_path);
            return false;
        }

        // Keys the file leaves out keep their defaults
        YAML::Node merged = YAML::Load(DEFAULT_CONFIG);
        for (auto it = loaded.begin(); it != loaded.end(); ++it)
        {
            const std::string key = it->first.as<std::string>();
            if (it->second.IsMap() && merged[key] && merged[key].IsMap())
            {
                for (auto inner = it->second.begin(); inner != it->second.end(); ++inner)
                {
                    merged[key][inner->first.as<std::string>()] = inner->second;
                }
            }
            else
            {
                merged[key] = it->second;
            }
        }

        std::string log_level;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_ = merged;
            config_path_ = file_path;
            log_level = config_["log_level"].as<std::string>();
        }
        Logger::info("Configuration loaded from: " + file_path);

        // Apply critical settings immediately
        Logger::setLevel(log_level);
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error loading config: " + std::string(e.what()));
        return false;
    }
}

bool ServerConfigManager::saveConfig(const std::string &file_path) const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return saveConfigInternal(file_path, config_);
}

bool ServerConfigManager::saveConfigInternal(const std::string &file_path, const YAML::Node &config) const
{
    try
    {
        std::ofstream file(file_path);
        if (!file.is_open())
        {
            Logger::error("Could not open config file for writing: " + file_path);
            return false;
        }
        file << config;
        Logger::info("Configuration saved to: " + file_path);
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error saving config: " + std::string(e.what()));
        return false;
    }
}

bool ServerConfigManager::validateConfig(const YAML::Node &config) const
{
    if (!config.IsMap())
    {
        Logger::error("Configuration root must be a map");
        return false;
    }
    std::vector<std::string> required_fields = {"log_level", "server_port", "server_host"};
    for (const auto &field : required_fields)
    {
        if (!config[field])
        {
            Logger::error("Missing required config field: " + field);
            return false;
        }
    }

    try
    {
        int port = config["server_port"].as<int>();
        if (port <= 0 || port > 65535)
        {
            Logger::error("Invalid server port: " + std::to_string(port));
            return false;
        }
        std::string log_level = config["log_level"].as<std::string>();
        if (!Logger::isValidLevel(log_level))
        {
            Logger::error("Invalid log level: " + log_level);
            return false;
        }

        const YAML::Node generation = config["generation"];
        for (const char *key : {"batch_size", "max_embed_size_bytes", "max_image_width", "max_image_height",
                                "max_package_bytes", "local_payload_ceiling_bytes", "low_memory_threshold_gb",
                                "low_memory_max_images"})
        {
            if (!positiveIfPresent(generation, key))
                return false;
        }
        if (generation && generation["jpeg_quality"])
        {
            int quality = generation["jpeg_quality"].as<int>();
            if (quality < 1 || quality > 100)
            {
                Logger::error("Invalid generation.jpeg_quality: " + std::to_string(quality));
                return false;
            }
        }

        const YAML::Node storage = config["storage"];
        for (const char *key : {"connect_timeout_seconds", "read_timeout_seconds", "max_download_bytes"})
        {
            if (!positiveIfPresent(storage, key))
                return false;
        }
        if (!positiveIfPresent(config["remote_generation"], "timeout_seconds") ||
            !positiveIfPresent(config["text_enhancement"], "timeout_seconds"))
        {
            return false;
        }
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("Invalid configuration value: " + std::string(e.what()));
        return false;
    }

    return true;
}
