#include "bridge.hpp"
#include "utils/logger.hpp"
#include "utils/config.hpp"

#include <iostream>

void printUsage(const char* program) {
    std::cout << "Pitwall - F1 UDP telemetry bridge\n";
    std::cout << "Usage: " << program << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>   Load configuration from file\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "\n";
    std::cout << "Receives F1 2019 / F1 2020 telemetry on UDP port 20777 (default)\n";
    std::cout << "and writes one JSON document per packet to stdout or output_path.\n";
    std::cout << "See config/pitwall.conf for the available settings.\n";
}

int main(int argc, char* argv[]) {
    // Parse arguments
    std::string configFile;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
            else {
                std::cerr << "Error: --config requires a filename\n";
                return 1;
            }
        }
        else {
            std::cerr << "Error: unknown option " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    // Console logging until the config says otherwise
    pitwall::utils::Logger::init("", "info");

    auto& config = pitwall::utils::Config::instance();

    if (!configFile.empty()) {
        if (!config.loadFromFile(configFile)) {
            LOG_ERROR("Failed to load config file: {}", configFile);
            pitwall::utils::Logger::shutdown();
            return 1;
        }
    }

    const auto& settings = config.getBridgeConfig();
    pitwall::utils::Logger::init(settings.log_file, "info");
    if (!pitwall::utils::Logger::setLevel(settings.log_level)) {
        LOG_WARN("Unknown log level '{}', using info", settings.log_level);
    }

    LOG_INFO("===========================================");
    LOG_INFO("  Pitwall telemetry bridge");
    LOG_INFO("  Version 0.1.0");
    LOG_INFO("===========================================");
    if (!configFile.empty()) {
        LOG_INFO("Loaded configuration from {}", configFile);
    }

    // Create and initialize bridge
    pitwall::Bridge bridge;

    if (!bridge.init(settings)) {
        LOG_ERROR("Failed to initialize bridge");
        pitwall::utils::Logger::shutdown();
        return 1;
    }

    if (!bridge.start()) {
        LOG_ERROR("Failed to start bridge");
        pitwall::utils::Logger::shutdown();
        return 1;
    }

    LOG_INFO("Bridge is running. Press Ctrl+C to stop.");

    // Run bridge (blocking)
    bridge.run();

    LOG_INFO("Bridge shutdown complete");

    pitwall::utils::Logger::shutdown();

    return 0;
}
