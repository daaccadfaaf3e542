#pragma once

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

/**
 * @brief Process-wide key/value configuration backed by Poco's JSONConfiguration
 *
 * Keys are dotted paths into the JSON document ("analysis.max_target_frames").
 * A value that is missing or cannot be converted to the requested type yields
 * the caller's default.
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
     * @brief Replace the current document with the contents of a file
     * @return false if the file is missing or not valid JSON; the previous document is kept
     */
    bool load(const std::string &path);

    /**
     * @brief Replace the current document with JSON text
     */
    bool loadFromString(const std::string &json_text);

    bool save(const std::string &path) const;

    nlohmann::json getAll() const;

    // Merge a (nested) JSON object into the document, key by key
    void update(const nlohmann::json &patch);

    // Drop every loaded value
    void reset();

    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    double getDouble(const std::string &key, double def) const;
    bool getBool(const std::string &key, bool def) const;
    bool has(const std::string &key) const;

private:
    PocoConfigManager();
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    bool parse(std::istream &in, const std::string &origin);
    void applyPatch(const std::string &prefix, const nlohmann::json &node);

    template <typename T, typename Getter>
    T read(const std::string &key, const T &def, Getter getter) const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
