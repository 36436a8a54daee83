#pragma once

#include "core/poco_config_manager.hpp"
#include "core/forensics_config.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

class ConfigObserver;
struct ConfigUpdateEvent;

/**
 * @brief Application-facing configuration facade over PocoConfigManager.
 *
 * Seeds the store with the ForensicsConfig defaults, overlays config.json when
 * it exists, and notifies subscribed observers about every accepted change.
 * Updates are validated as a whole before they are applied.
 */
class PocoConfigAdapter
{
public:
    static PocoConfigAdapter &getInstance()
    {
        static PocoConfigAdapter instance;
        return instance;
    }

    ~PocoConfigAdapter() = default;

    nlohmann::json getAll() const;
    std::string getLogLevel() const;
    int getMaxProcessingThreads() const;

    /**
     * @brief Materialize the typed pipeline configuration
     * @throws std::invalid_argument if the stored values fail validation
     */
    ForensicsConfig getForensicsConfig() const;

    void setLogLevel(const std::string &level);

    /**
     * @brief Merge a JSON patch into the configuration
     * @param json_config JSON object text
     * @throws std::invalid_argument on malformed JSON or values that fail validation
     */
    void updateConfig(const std::string &json_config, const std::string &source = "api");

    bool loadConfig(const std::string &file_path);
    bool saveConfig(const std::string &file_path) const;

    // Restore the built-in defaults without notifying observers
    void resetToDefaults();

    bool validateConfig() const;

    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

    void addObserver(ConfigObserver *observer) { subscribe(observer); }
    void removeObserver(ConfigObserver *observer) { unsubscribe(observer); }

private:
    PocoConfigAdapter();
    PocoConfigAdapter(const PocoConfigAdapter &) = delete;
    PocoConfigAdapter &operator=(const PocoConfigAdapter &) = delete;

    void publishEvent(const ConfigUpdateEvent &event);
    void initializeDefaultConfig();
    std::string nextUpdateId();

    PocoConfigManager &poco_cfg_;

    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;

    std::atomic<unsigned long> update_counter_{0};
};
