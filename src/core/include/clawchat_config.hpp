#pragma once

#include "clawchat_settings.hpp"

#include <string>
#include <cstdint>
#include <map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <mutex>

namespace clawchat {

/**
 * @brief Runtime configuration for clawchat
 *
 * String key/values in `key = value` form. Layering, lowest first:
 * defaults, config file, environment, command-line flags (set()).
 * Thread-safe singleton pattern.
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    // Prevent copying
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    int getInt(const std::string& key, int default_val = 0) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        try { return std::stoi(v); }
        catch (const std::exception&) { return default_val; }
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        std::transform(v.begin(), v.end(), v.begin(), ::tolower);
        return (v == "true" || v == "1" || v == "yes" || v == "on");
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return it != values_.end() && !it->second.empty();
    }

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    void setInt(const std::string& key, int value) {
        set(key, std::to_string(value));
    }

    void setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    // ==================== File I/O ====================
    bool loadFromFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        std::ifstream file(path);
        if (!file.is_open()) return false;

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            // Skip comments and empty lines
            auto first = line.find_first_not_of(" \t");
            if (first == std::string::npos || line[first] == '#' || line[first] == ';') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            // Trim whitespace
            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t") + 1);
            val.erase(0, val.find_first_not_of(" \t"));
            val.erase(val.find_last_not_of(" \t") + 1);

            if (!key.empty()) values_[key] = val;
        }
        return true;
    }

    bool saveToFile(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::ofstream file(path);
        if (!file.is_open()) return false;

        file << "# clawchat configuration\n";
        file << "# Auto-generated\n\n";
        for (const auto& [k, v] : values_) {
            file << k << " = " << v << "\n";
        }
        return true;
    }

    // ==================== Defaults ====================
    void loadDefaults() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_["gateway.url"] = kDefaultGatewayUrl;
        values_["gateway.token"] = "";
        values_["gateway.session"] = "";
        values_["gateway.backend"] = "gateway";
        values_["gateway.request_timeout_ms"] = "30000";
        values_["gateway.max_retries"] = "10";
        values_["ssh.host"] = "";
        values_["ssh.port"] = "22";
        values_["ssh.user"] = "";
        values_["ssh.key_path"] = "";
        values_["ssh.remote_port"] = "18789";
        values_["ssh.ready_timeout_ms"] = "15000";
        values_["log.level"] = "warn";
        values_["log.file"] = "";
        values_["log.console"] = "true";
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.clear();
    }

    // ==================== clawchat specifics ====================

    static constexpr const char* kDefaultGatewayUrl = "ws://localhost:18789";
    static constexpr const char* kDefaultHeadlessUrl = "ws://localhost:42617";

    /// $CLAWCHAT_CONFIG, else ~/.config/clawchat-cli/config
    static std::string defaultPath();

    /**
     * @brief Overlay values from the process environment
     *
     * OPENCLAW_GATEWAY_URL (or CLAWCHAT_GATEWAY), OPENCLAW_TOKEN,
     * CLAWCHAT_SESSION, CLAWCHAT_BACKEND, CLAWCHAT_SSH_HOST.
     */
    void applyEnvironment();

    /// Typed view of the current values
    GatewaySettings gatewaySettings() const;

    /// Empty when usable, otherwise what is wrong
    std::string validate() const;

private:
    Config() { loadDefaults(); }

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

} // namespace clawchat
