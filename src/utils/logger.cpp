#include "utils/logger.hpp"

#include <cstdio>
#include <vector>

namespace pitwall::utils {

std::shared_ptr<spdlog::logger> Logger::s_logger;

void Logger::init(const std::string& logFile, const std::string& level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink with colors
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        // File sink with rotation
        if (!logFile.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 1024 * 1024 * 5, 3); // 5MB, 3 files
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (s_logger) {
            spdlog::drop(s_logger->name());
        }
        s_logger = std::make_shared<spdlog::logger>("pitwall", sinks.begin(), sinks.end());

        s_logger->set_level(spdlog::level::from_str(level));
        s_logger->flush_on(spdlog::level::warn);

        spdlog::register_logger(s_logger);
        spdlog::set_default_logger(s_logger);

        s_logger->debug("Logger initialized");
    }
    catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Logger init failed: %s\n", ex.what());
        s_logger = std::make_shared<spdlog::logger>("pitwall",
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
}

bool Logger::setLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps anything it does not know to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    if (s_logger) {
        s_logger->set_level(parsed);
    }
    return true;
}

void Logger::shutdown() {
    if (s_logger) {
        s_logger->debug("Logger shutting down");
        s_logger->flush();
    }
    spdlog::shutdown();
}

} // namespace pitwall::utils
