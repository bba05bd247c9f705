#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace wum::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Only the application shell reads it; engine components receive their
 * settings as plain option structs.
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file, merged over the defaults
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            json loaded = json::parse(file);
            if (!loaded.is_object()) {
                return false;
            }
            m_config = defaults();
            m_config.merge_patch(loaded);
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
            return false;
        } catch (const std::filesystem::filesystem_error&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            m_configPath = savePath;
            return static_cast<bool>(file);

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Reset to default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.maxConcurrent")
     * @param defaultValue Default value if key not found or of the wrong type
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            return m_config.contains(toJsonPointer(key));
        } catch (const json::exception&) {
            return false;
        }
    }

    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    void merge(const json& other) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(other);
    }

    const std::string& path() const { return m_configPath; }

    static json defaults() {
        return {
            {"version", "2.0.0"},
            {"downloads", {
                {"directory", ""},
                {"maxConcurrent", 1},
                {"queueDelayMs", 10000},
                {"stallTimeoutMs", 120000},
                {"extractArchives", true},
                {"removeArchiveAfterExtract", true}
            }},
            {"retry", {
                {"maxRetries", 3},
                {"strategy", "exponential"},
                {"baseDelayMs", 2000},
                {"maxDelayMs", 60000}
            }},
            {"catalog", {
                {"downloadUrl", "https://download2.vimm.net/download/?mediaId={id}"},
                {"referer", "https://vimm.net/"},
                {"userAgent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                              "(KHTML, like Gecko) Chrome/120.0 Safari/537.36"},
                {"timeoutSeconds", 3600},
                {"verifySsl", true}
            }},
            {"device", {
                {"bufferSize", 1048576},
                {"verifyAfterCopy", true},
                {"cleanupEmptyDirs", true},
                {"gameFolder", "wbfs"},
                {"supportedFormats", {".wbfs", ".iso", ".rvz"}},
                {"maxParallelVolumes", 2}
            }},
            {"verification", {
                {"algorithm", "sha1"}
            }},
            {"logging", {
                {"level", "info"},
                {"maxFileSize", 10485760},
                {"maxFiles", 3}
            }}
        };
    }

private:
    Config() : m_config(defaults()) {}

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * Convert dot notation to JSON pointer
     * @param key Dot-notation key
     * @return JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace wum::core
