#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace pitwall::utils {

/**
 * Logger utility
 *
 * Centralized logging through spdlog. Console output goes to stderr;
 * stdout is reserved for the JSON document stream.
 */
class Logger {
public:
    // An empty logFile disables the rotating file sink
    static void init(const std::string& logFile = "pitwall.log",
                     const std::string& level = "info");
    static void shutdown();

    // Change the level after init ("trace" ... "critical", "off")
    static bool setLevel(const std::string& level);

    static std::shared_ptr<spdlog::logger> get() { return s_logger; }

    // Convenience logging functions
    template<typename... Args>
    static void trace(fmt::format_string<Args...> fmt, Args&&... args) {
        s_logger->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        s_logger->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(fmt::format_string<Args...> fmt, Args&&... args) {
        s_logger->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
        s_logger->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(fmt::format_string<Args...> fmt, Args&&... args) {
        s_logger->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(fmt::format_string<Args...> fmt, Args&&... args) {
        s_logger->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> s_logger;
};

#define LOG_TRACE(...) pitwall::utils::Logger::trace(__VA_ARGS__)
#define LOG_DEBUG(...) pitwall::utils::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  pitwall::utils::Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  pitwall::utils::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) pitwall::utils::Logger::error(__VA_ARGS__)
#define LOG_CRITICAL(...) pitwall::utils::Logger::critical(__VA_ARGS__)

} // namespace pitwall::utils
