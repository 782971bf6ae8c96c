/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "Logger.hpp"
#include <vector>
#include <filesystem>
#include <iostream>

namespace cyclebind {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
bool Logger::s_initialized = false;

void Logger::init(const std::string& log_file,
                  const std::string& level,
                  size_t max_size,
                  size_t max_files,
                  bool console_enabled) {
    if (s_initialized) {
        return;
    }

    try {
        // Create logs directory if needed
        std::filesystem::path log_path(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;

        // Console sink goes to stderr; stdout carries rendered cycles
        if (console_enabled) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        // File sink (rotating)
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, max_size, max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);

        s_logger = std::make_shared<spdlog::logger>("cyclebind", sinks.begin(), sinks.end());
        s_logger->set_level(parseLevel(level));

        // Flush on warn or above
        s_logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(s_logger);

        s_initialized = true;

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    }

    if (!s_initialized) {
        // Fall back to a console-only logger so LOG_* never dereferences null
        s_logger = spdlog::stderr_color_mt("cyclebind_fallback");
        s_logger->set_level(parseLevel(level));
        s_initialized = true;
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!s_initialized) {
        init(); // Initialize with defaults
    }
    return s_logger;
}

void Logger::shutdown() {
    if (s_logger) {
        s_logger->flush();
    }
    spdlog::drop_all();
    s_logger = nullptr;
    s_initialized = false;
}

spdlog::level::level_enum Logger::parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace cyclebind
