/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to engine configuration
 */

#pragma once

#include <string>
#include <mutex>
#include "EngineConfig.hpp"

namespace cyclebind {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Loads the engine configuration (logging, render defaults, binding policy)
 * from YAML. Thread-safe for reading after initialization.
 */
class ConfigManager {
public:
    /**
     * Get singleton instance
     */
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load engine configuration from YAML file
     * @param filepath Path to cyclebind.yaml
     * @return true if loaded successfully
     */
    bool loadEngineConfig(const std::string& filepath);

    /**
     * Load engine configuration from YAML text
     * @return true if parsed successfully
     */
    bool loadEngineConfigFromString(const std::string& yaml);

    /**
     * Get engine configuration (const reference)
     */
    const EngineConfig& engineConfig() const { return m_engine_config; }

    /**
     * Check if configuration is loaded and valid
     */
    bool isLoaded() const { return m_loaded; }

    /**
     * Restore built-in defaults
     */
    void reset();

    /**
     * Get configuration as JSON
     */
    std::string engineConfigToJson() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    EngineConfig m_engine_config;
    bool m_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace cyclebind
