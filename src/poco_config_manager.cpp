#include "core/poco_config_manager.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
    : cfg_(new JSONConfiguration())
{
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;

    const nlohmann::json from_file = nlohmann::json::parse(in);
    if (!from_file.is_object())
    {
        throw std::invalid_argument("Configuration file must hold a JSON object: " + path);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json merged = snapshot();
    merged.merge_patch(from_file);
    cfg_ = new JSONConfiguration();
    writeLeaves(merged);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return out.good();
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot();
}

std::vector<std::string> PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return writeLeaves(patch);
}

void PocoConfigManager::replace(const nlohmann::json &document)
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
    writeLeaves(document);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

void PocoConfigManager::flatten(const std::string &prefix, const nlohmann::json &node, std::vector<Leaf> &leaves)
{
    if (node.is_object())
    {
        for (auto it = node.begin(); it != node.end(); ++it)
        {
            flatten(prefix.empty() ? it.key() : prefix + "." + it.key(), it.value(), leaves);
        }
    }
    else if (!node.is_null() && !prefix.empty())
    {
        leaves.emplace_back(prefix, node);
    }
}

std::vector<std::string> PocoConfigManager::writeLeaves(const nlohmann::json &patch)
{
    std::vector<Leaf> leaves;
    flatten("", patch, leaves);

    std::vector<std::string> keys;
    keys.reserve(leaves.size());
    for (const auto &[key, value] : leaves)
    {
        if (value.is_boolean())
            cfg_->setBool(key, value.get<bool>());
        else if (value.is_number_integer())
            cfg_->setInt(key, value.get<int>());
        else if (value.is_number_float())
            cfg_->setDouble(key, value.get<double>());
        else if (value.is_string())
            cfg_->setString(key, value.get<std::string>());
        else
            cfg_->setString(key, value.dump());
        keys.push_back(key);
    }
    return keys;
}

nlohmann::json PocoConfigManager::snapshot() const
{
    std::stringstream ss;
    cfg_->save(ss);
    const std::string text = ss.str();
    if (text.empty())
        return nlohmann::json::object();
    return nlohmann::json::parse(text);
}
