#include "core/logger_observer.hpp"
#include "logging/logger.hpp"

void LoggerObserver::onConfigChanged(const ConfigEvent &event)
{
    if (event.type != ConfigEventType::LOG_LEVEL_CHANGED)
    {
        return;
    }

    try
    {
        const std::string new_log_level = event.new_value.as<std::string>();
        Logger::setLevel(new_log_level);
    }
    catch (const std::exception &e)
    {
        Logger::error("LoggerObserver: Error updating log level: " + std::string(e.what()));
    }
}
