#include "core/poco_config_adapter.hpp"
#include "core/config_observer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <stdexcept>

PocoConfigAdapter::PocoConfigAdapter()
    : poco_cfg_(PocoConfigManager::getInstance())
{
    initializeDefaultConfig();

    if (!loadConfig("config.json"))
    {
        Logger::info("No config.json found, using built-in defaults");
    }
}

nlohmann::json PocoConfigAdapter::getAll() const
{
    return poco_cfg_.getAll();
}

std::string PocoConfigAdapter::getLogLevel() const
{
    return poco_cfg_.getString("log_level", "INFO");
}

int PocoConfigAdapter::getMaxProcessingThreads() const
{
    return poco_cfg_.getInt("max_processing_threads", 4);
}

ForensicsConfig PocoConfigAdapter::getForensicsConfig() const
{
    return ForensicsConfig::fromJson(poco_cfg_.getAll());
}

void PocoConfigAdapter::setLogLevel(const std::string &level)
{
    if (!Logger::isValidLevel(level))
    {
        throw std::invalid_argument("Invalid log level: " + level);
    }

    std::string old_level = getLogLevel();
    ConfigUpdateEvent event;
    event.changed_keys = poco_cfg_.update({{"log_level", level}});
    event.source = "api";
    event.update_id = nextUpdateId();

    Logger::debug("Log level changed from " + old_level + " to " + level);
    publishEvent(event);
}

void PocoConfigAdapter::updateConfig(const std::string &json_config, const std::string &source)
{
    nlohmann::json patch;
    try
    {
        patch = nlohmann::json::parse(json_config);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::invalid_argument("Malformed configuration JSON: " + std::string(e.what()));
    }
    if (!patch.is_object())
    {
        throw std::invalid_argument("Configuration update must be a JSON object");
    }

    // Validate the merged result before touching the live store
    nlohmann::json merged = poco_cfg_.getAll();
    merged.merge_patch(patch);
    ForensicsConfig::fromJson(merged);

    ConfigUpdateEvent event;
    event.changed_keys = poco_cfg_.update(patch);
    event.source = source;
    event.update_id = nextUpdateId();

    publishEvent(event);
}

bool PocoConfigAdapter::loadConfig(const std::string &file_path)
{
    try
    {
        // Partial files overlay the current values
        if (!poco_cfg_.load(file_path))
        {
            return false;
        }
        ForensicsConfig::fromJson(poco_cfg_.getAll());
        Logger::info("Configuration loaded from " + file_path);
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to load configuration from " + file_path + ": " + e.what());
        initializeDefaultConfig();
        return false;
    }
}

bool PocoConfigAdapter::saveConfig(const std::string &file_path) const
{
    try
    {
        return poco_cfg_.save(file_path);
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to save configuration to " + file_path + ": " + e.what());
        return false;
    }
}

void PocoConfigAdapter::resetToDefaults()
{
    initializeDefaultConfig();
}

bool PocoConfigAdapter::validateConfig() const
{
    try
    {
        getForensicsConfig();
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::warn("Configuration validation failed: " + std::string(e.what()));
        return false;
    }
}

void PocoConfigAdapter::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
    {
        observers_.push_back(observer);
    }
}

void PocoConfigAdapter::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void PocoConfigAdapter::publishEvent(const ConfigUpdateEvent &event)
{
    std::vector<ConfigObserver *> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    Logger::info("Publishing config update " + event.update_id + " (" +
                 std::to_string(event.changed_keys.size()) + " keys) from " + event.source);
    for (auto observer : observers)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in config observer: " + std::string(e.what()));
        }
    }
}

void PocoConfigAdapter::initializeDefaultConfig()
{
    poco_cfg_.replace(ForensicsConfig{}.toJson());
    Logger::debug("Default configuration initialized");
}

std::string PocoConfigAdapter::nextUpdateId()
{
    return "update-" + std::to_string(++update_counter_);
}
