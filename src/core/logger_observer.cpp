#include "core/logger_observer.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>

void LoggerObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (hasLogLevelChange(event))
    {
        try
        {
            auto &config_manager = PocoConfigAdapter::getInstance();
            std::string new_log_level = config_manager.getLogLevel();

            Logger::setLevel(new_log_level);
            applied_level_ = new_log_level;

            Logger::debug("LoggerObserver: applied log level " + new_log_level);
        }
        catch (const std::exception &e)
        {
            Logger::error("LoggerObserver: Error updating log level: " + std::string(e.what()));
        }
    }
}

bool LoggerObserver::hasLogLevelChange(const ConfigUpdateEvent &event) const
{
    return std::find(event.changed_keys.begin(), event.changed_keys.end(), "log_level") != event.changed_keys.end();
}
