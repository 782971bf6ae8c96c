/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace cyclebind {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

EngineConfig parseEngineConfig(const YAML::Node& root) {
    EngineConfig cfg;
    // Sections may also sit at the top level
    const YAML::Node engine = root["engine"] ? root["engine"] : root;

    cfg.version = engine["version"].as<std::string>("1.0.0");

    // Logging settings
    if (engine["logging"]) {
        auto logging = engine["logging"];
        cfg.logging.level = logging["level"].as<std::string>("info");
        cfg.logging.file = logging["file"].as<std::string>("logs/cyclebind.log");
        cfg.logging.max_size_mb = logging["max_size_mb"].as<int>(10);
        cfg.logging.max_files = logging["max_files"].as<int>(5);
        cfg.logging.console_enabled = logging["console_enabled"].as<bool>(true);
    }

    // Render settings
    if (engine["render"]) {
        auto render = engine["render"];
        cfg.render.cycles_start = render["cycles_start"].as<int64_t>(0);
        cfg.render.cycles_end = render["cycles_end"].as<int64_t>(10);
        cfg.render.threads = render["threads"].as<int>(1);
        cfg.render.pretty = render["pretty"].as<bool>(false);
    }

    // Binding resolution settings
    if (engine["bindings"]) {
        auto bindings = engine["bindings"];
        cfg.bindings.allow_unsafe_functions = bindings["allow_unsafe_functions"].as<bool>(false);
    }

    return cfg;
}

bool validate(const EngineConfig& cfg) {
    if (cfg.render.threads < 1) {
        LOG_ERROR("render.threads must be at least 1, got {}", cfg.render.threads);
        return false;
    }
    if (cfg.render.cycles_end < cfg.render.cycles_start) {
        LOG_ERROR("render.cycles_end ({}) is before render.cycles_start ({})",
                  cfg.render.cycles_end, cfg.render.cycles_start);
        return false;
    }
    if (cfg.logging.max_size_mb < 1 || cfg.logging.max_files < 1) {
        LOG_ERROR("logging.max_size_mb and logging.max_files must be positive");
        return false;
    }
    return true;
}

} // namespace

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadEngineConfig(const std::string& filepath) {
    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("Engine config file not found: {}", filepath);
            return false;
        }

        LOG_INFO("Loading engine config from: {}", filepath);

        EngineConfig cfg = parseEngineConfig(YAML::LoadFile(filepath));
        if (!validate(cfg)) {
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_engine_config = cfg;
        m_loaded = true;
        LOG_INFO("Engine config loaded: version {}", m_engine_config.version);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in engine config: {}", e.what());
        return false;
    } catch (const fs::filesystem_error& e) {
        LOG_ERROR("Error loading engine config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadEngineConfigFromString(const std::string& yaml) {
    try {
        EngineConfig cfg = parseEngineConfig(YAML::Load(yaml));
        if (!validate(cfg)) {
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_engine_config = cfg;
        m_loaded = true;
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in engine config: {}", e.what());
        return false;
    }
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_engine_config = EngineConfig{};
    m_loaded = false;
}

std::string ConfigManager::engineConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json j;
    j["version"] = m_engine_config.version;

    j["logging"] = {
        {"level", m_engine_config.logging.level},
        {"file", m_engine_config.logging.file},
        {"max_size_mb", m_engine_config.logging.max_size_mb},
        {"max_files", m_engine_config.logging.max_files}
    };

    j["render"] = {
        {"cycles_start", m_engine_config.render.cycles_start},
        {"cycles_end", m_engine_config.render.cycles_end},
        {"threads", m_engine_config.render.threads},
        {"pretty", m_engine_config.render.pretty}
    };

    j["bindings"] = {
        {"allow_unsafe_functions", m_engine_config.bindings.allow_unsafe_functions}
    };

    return j.dump();
}

} // namespace config
} // namespace cyclebind
