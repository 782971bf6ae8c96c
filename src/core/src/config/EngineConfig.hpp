/**
 * @file EngineConfig.hpp
 * @brief Engine configuration data structures
 */

#pragma once

#include <cstdint>
#include <string>

namespace cyclebind {
namespace config {

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/cyclebind.log";
    int max_size_mb = 10;
    int max_files = 5;
    bool console_enabled = true;
};

/**
 * Cycle rendering defaults for the command line tool
 */
struct RenderConfig {
    int64_t cycles_start = 0;
    int64_t cycles_end = 10;    // exclusive
    int threads = 1;
    bool pretty = false;
};

/**
 * Binding function resolution
 */
struct BindingsConfig {
    bool allow_unsafe_functions = false;
};

/**
 * Complete engine configuration
 */
struct EngineConfig {
    std::string version = "1.0.0";
    LoggingConfig logging;
    RenderConfig render;
    BindingsConfig bindings;
};

} // namespace config
} // namespace cyclebind
