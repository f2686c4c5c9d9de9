/**
 * @file config_manager.h
 * @brief Centralized configuration access
 *
 * Provides unified access to the environment variables that tune libpubid.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Runtime overrides (set) that take precedence over the environment
 * - Thread-safe singleton pattern
 *
 * @date 2026-10-18
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace pubid {
namespace common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove a runtime override
     */
    void unset(const std::string& key);

    /**
     * @brief Load configuration from environment
     */
    void loadFromEnvironment();

    /// @name Predefined Configuration Keys
    static constexpr const char* LOG_LEVEL = "PUBID_LOG_LEVEL";
    static constexpr const char* DEFAULT_PUBLISHER = "PUBID_DEFAULT_PUBLISHER";
    static constexpr const char* ALLOW_MISSING_PUBLISHER = "PUBID_ALLOW_MISSING_PUBLISHER";
};

} // namespace common
} // namespace pubid
