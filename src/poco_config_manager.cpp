#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
    : cfg_(new JSONConfiguration())
{
}

bool PocoConfigManager::parse(std::istream &in, const std::string &origin)
{
    AutoPtr<JSONConfiguration> parsed = new JSONConfiguration();
    try
    {
        parsed->load(in);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse configuration " + origin + ": " + e.displayText());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = parsed;
    return true;
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::debug("Configuration file not readable: " + path);
        return false;
    }
    return parse(in, path);
}

bool PocoConfigManager::loadFromString(const std::string &json_text)
{
    std::istringstream in(json_text);
    return parse(in, "<string>");
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::ofstream out(path);
    if (!out.is_open())
    {
        Logger::error("Cannot write configuration to " + path);
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_->save(out, 4);
    return out.good();
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::ostringstream dump;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_->save(dump);
    }
    return nlohmann::json::parse(dump.str(), nullptr, false);
}

void PocoConfigManager::applyPatch(const std::string &prefix, const nlohmann::json &node)
{
    if (node.is_object())
    {
        for (const auto &item : node.items())
        {
            applyPatch(prefix.empty() ? item.key() : prefix + "." + item.key(), item.value());
        }
        return;
    }

    switch (node.type())
    {
    case nlohmann::json::value_t::boolean:
        cfg_->setBool(prefix, node.get<bool>());
        break;
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
        cfg_->setInt(prefix, node.get<int>());
        break;
    case nlohmann::json::value_t::number_float:
        cfg_->setDouble(prefix, node.get<double>());
        break;
    case nlohmann::json::value_t::string:
        cfg_->setString(prefix, node.get<std::string>());
        break;
    case nlohmann::json::value_t::null:
        break;
    default:
        // Arrays are stored as their JSON text
        cfg_->setString(prefix, node.dump());
        break;
    }
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch("", patch);
}

void PocoConfigManager::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
}

template <typename T, typename Getter>
T PocoConfigManager::read(const std::string &key, const T &def, Getter getter) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cfg_->has(key))
        return def;
    try
    {
        return getter(*cfg_);
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("Configuration value " + key + " is unusable (" + e.displayText() + "), using default");
        return def;
    }
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    return read<std::string>(key, def, [&](const JSONConfiguration &cfg)
                             { return cfg.getString(key); });
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    return read<int>(key, def, [&](const JSONConfiguration &cfg)
                     { return cfg.getInt(key); });
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    return read<double>(key, def, [&](const JSONConfiguration &cfg)
                        { return cfg.getDouble(key); });
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    return read<bool>(key, def, [&](const JSONConfiguration &cfg)
                      { return cfg.getBool(key); });
}

bool PocoConfigManager::has(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}
