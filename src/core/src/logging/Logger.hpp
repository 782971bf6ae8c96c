/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace cyclebind {

class Logger {
public:
    /**
     * Initialize the logging system
     * @param log_file Path to log file
     * @param level Log level (trace, debug, info, warn, error)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     * @param console_enabled Also log to stderr
     */
    static void init(const std::string& log_file = "logs/cyclebind.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5,
                     bool console_enabled = true);

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * Drop the current logger so the next init() can reconfigure sinks
     */
    static void shutdown();

    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace cyclebind

// Convenience macros
#define LOG_TRACE(...) ::cyclebind::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::cyclebind::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::cyclebind::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::cyclebind::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::cyclebind::Logger::get()->error(__VA_ARGS__)
