#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <istream>

namespace LanScout {

    /**
     * @brief Flat key=value settings store.
     *
     * Files use one `key = value` per line; blank lines and lines starting
     * with '#' are ignored. Later layers override earlier ones unless
     * `overrideExisting` is false.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;


        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        bool loadFromString(const std::string& content, bool overrideExisting = true);

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;

        bool getBool(const std::string& key, bool defaultValue = false) const;

        /// Comma separated list; entries are trimmed and empty entries dropped
        std::vector<std::string> getList(const std::string& key,
                                         const std::vector<std::string>& defaultValue = {}) const;

        bool validate(const std::unordered_map<std::string, Validator>& schema) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        static std::vector<std::pair<std::string, std::string>> parse(std::istream& input);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
