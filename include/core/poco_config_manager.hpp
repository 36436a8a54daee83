#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Thread-safe key/value store backed by a Poco JSONConfiguration.
 *
 * Keys use Poco's dotted notation ("fusion.signal_timeout_seconds"). Arrays
 * such as metadata.editor_names are stored as their JSON text.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    /**
     * @brief Overlay a JSON object file on the current values
     * @return false if the file cannot be opened
     * @throws nlohmann::json::parse_error on malformed JSON
     * @throws std::invalid_argument if the document is not an object
     */
    bool load(const std::string &path);
    bool save(const std::string &path) const;

    nlohmann::json getAll() const;

    /**
     * @brief Write every non-null leaf of patch under its dotted key
     * @return The dotted keys written
     */
    std::vector<std::string> update(const nlohmann::json &patch);

    // Drop every key, then write document
    void replace(const nlohmann::json &document);

    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;
    double getDouble(const std::string &key, double def) const;

private:
    using Leaf = std::pair<std::string, nlohmann::json>;

    PocoConfigManager();

    static void flatten(const std::string &prefix, const nlohmann::json &node, std::vector<Leaf> &leaves);

    // Caller holds mutex_
    std::vector<std::string> writeLeaves(const nlohmann::json &patch);
    nlohmann::json snapshot() const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
