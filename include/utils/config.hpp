#pragma once

#include <cstdint>
#include <string>

namespace pitwall::utils {

/**
 * Bridge settings, with the defaults used when no config file is given.
 */
struct BridgeConfig {
    // UDP listener (the game's default telemetry port)
    std::string listen_host = "0.0.0.0";
    uint16_t listen_port = 20777;

    // JSON lines output, "-" for stdout
    std::string output_path = "-";

    // Logging; an empty log_file logs to the console only
    std::string log_file = "pitwall.log";
    std::string log_level = "info";

    unsigned int worker_threads = 1;

    // Seconds between statistics log lines, 0 disables them
    unsigned int stats_interval = 60;
};

/**
 * Configuration manager
 *
 * Loads and saves the bridge configuration as "key = value" lines.
 */
class Config {
public:
    static Config& instance();

    // Load config from file. Fails on an unreadable file or a bad value;
    // unknown keys are skipped with a warning.
    bool loadFromFile(const std::string& path);

    // Save config to file
    bool saveToFile(const std::string& path);

    const BridgeConfig& getBridgeConfig() const { return m_config; }
    BridgeConfig& getBridgeConfig() { return m_config; }

    void setListenPort(uint16_t port) { m_config.listen_port = port; }
    void setOutputPath(const std::string& path) { m_config.output_path = path; }

    // Back to defaults
    void reset() { m_config = BridgeConfig{}; }

private:
    Config() = default;
    BridgeConfig m_config;
};

} // namespace pitwall::utils
