#include "utils/config.hpp"
#include "utils/logger.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

namespace pitwall::utils {

namespace {

// Whole-string unsigned parse; throws std::invalid_argument / std::out_of_range
unsigned long parseUnsigned(const std::string& value, unsigned long max) {
    size_t used = 0;
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument(value);
    }
    unsigned long parsed = std::stoul(value, &used);
    if (used != value.size()) {
        throw std::invalid_argument(value);
    }
    if (parsed > max) {
        throw std::out_of_range(value);
    }
    return parsed;
}

} // namespace

Config& Config::instance() {
    static Config config;
    return config;
}

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    BridgeConfig loaded = m_config;
    std::string line;
    int lineNumber = 0;

    while (std::getline(file, line)) {
        lineNumber++;

        // Trim whitespace
        auto trim = [](std::string& s) {
            s.erase(0, s.find_first_not_of(" \t\r"));
            s.erase(s.find_last_not_of(" \t\r") + 1);
        };
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            LOG_WARN("{}:{}: ignoring line without '='", path, lineNumber);
            continue;
        }

        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);
        trim(key);
        trim(value);

        try {
            if (key == "listen_host") {
                loaded.listen_host = value;
            }
            else if (key == "listen_port") {
                loaded.listen_port = static_cast<uint16_t>(
                    parseUnsigned(value, std::numeric_limits<uint16_t>::max()));
            }
            else if (key == "output_path") {
                loaded.output_path = value;
            }
            else if (key == "log_file") {
                loaded.log_file = value;
            }
            else if (key == "log_level") {
                loaded.log_level = value;
            }
            else if (key == "worker_threads") {
                loaded.worker_threads = static_cast<unsigned int>(parseUnsigned(value, 64));
                if (loaded.worker_threads == 0) {
                    throw std::out_of_range(value);
                }
            }
            else if (key == "stats_interval") {
                loaded.stats_interval = static_cast<unsigned int>(parseUnsigned(value, 86400));
            }
            else {
                LOG_WARN("{}:{}: unknown key '{}'", path, lineNumber, key);
            }
        }
        catch (const std::logic_error&) {
            LOG_ERROR("{}:{}: invalid value '{}' for {}", path, lineNumber, value, key);
            return false;
        }
    }

    m_config = loaded;
    return true;
}

bool Config::saveToFile(const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }

    file << "# Pitwall telemetry bridge configuration\n\n";

    file << "# UDP listener (set the same port in the game's telemetry settings)\n";
    file << "listen_host = " << m_config.listen_host << "\n";
    file << "listen_port = " << m_config.listen_port << "\n\n";

    file << "# JSON lines output, - for stdout\n";
    file << "output_path = " << m_config.output_path << "\n\n";

    file << "# Logging\n";
    file << "log_file = " << m_config.log_file << "\n";
    file << "log_level = " << m_config.log_level << "\n\n";

    file << "# Runtime\n";
    file << "worker_threads = " << m_config.worker_threads << "\n";
    file << "stats_interval = " << m_config.stats_interval << "\n";

    return file.good();
}

} // namespace pitwall::utils
