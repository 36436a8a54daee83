#pragma once

#include <string>
#include <vector>

/**
 * @brief Configuration update event
 */
struct ConfigUpdateEvent
{
    std::vector<std::string> changed_keys; // Dotted keys written, e.g. "log_level", "ela.jpeg_quality"
    std::string source;                    // Source of the update: "api", "file" or "cli"
    std::string update_id;                 // Unique identifier to prevent feedback loops
};

/**
 * @brief Observer interface for configuration changes
 */
class ConfigObserver
{
public:
    virtual ~ConfigObserver() = default;
    virtual void onConfigUpdate(const ConfigUpdateEvent &event) = 0;
};
