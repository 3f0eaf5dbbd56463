#pragma once

#include "core/server_config_manager.hpp"

/**
 * @brief Applies log_level changes to the Logger as soon as they are published
 */
class LoggerObserver : public ConfigObserver
{
public:
    LoggerObserver() = default;
    ~LoggerObserver() override = default;

    void onConfigChanged(const ConfigEvent &event) override;
};
