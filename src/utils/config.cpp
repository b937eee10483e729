#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "cfdp/exceptions.hpp"

#include <fstream>
#include <sstream>

namespace cfdp::utils {

namespace {

bool parseBool(const std::string& value, bool& out) {
    if (value == "true" || value == "1" || value == "yes") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        out = false;
        return true;
    }
    return false;
}

void checkWidth(size_t width) {
    if (width != 1 && width != 2 && width != 4 && width != 8) {
        throw RangeError("header field width must be 1, 2, 4 or 8 bytes, got " + std::to_string(width));
    }
}

} // namespace

Config& Config::instance() {
    static Config config;
    return config;
}

void Config::setEntityIdWidth(size_t width) {
    checkWidth(width);
    m_config.entity_id_width = width;
}

void Config::setSeqNumWidth(size_t width) {
    checkWidth(width);
    m_config.seq_num_width = width;
}

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(file, line)) {
        lineNo++;
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);

        // Trim whitespace
        auto trim = [](std::string& s) {
            s.erase(0, s.find_first_not_of(" \t\r"));
            s.erase(s.find_last_not_of(" \t\r") + 1);
        };
        trim(key);
        trim(value);

        try {
            if (key == "crc_flag") {
                if (!parseBool(value, m_config.crc_flag)) {
                    LOG_WARN("{}:{}: invalid boolean '{}' for crc_flag", path, lineNo, value);
                }
            }
            else if (key == "large_file") {
                if (!parseBool(value, m_config.large_file)) {
                    LOG_WARN("{}:{}: invalid boolean '{}' for large_file", path, lineNo, value);
                }
            }
            else if (key == "entity_id_width") {
                setEntityIdWidth(std::stoul(value));
            }
            else if (key == "seq_num_width") {
                setSeqNumWidth(std::stoul(value));
            }
            else if (key == "log_file") {
                m_config.log_file = value;
            }
            else if (key == "log_level") {
                m_config.log_level = value;
            }
            else {
                LOG_WARN("{}:{}: ignoring unknown key '{}'", path, lineNo, key);
            }
        }
        catch (const std::logic_error& ex) {
            // std::stoul and the width checks, keep the current value
            LOG_WARN("{}:{}: invalid value '{}' for {}: {}", path, lineNo, value, key, ex.what());
        }
    }

    return true;
}

bool Config::saveToFile(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }

    file << "# CFDP codec configuration\n\n";

    file << "# PDU header defaults\n";
    file << "crc_flag = " << (m_config.crc_flag ? "true" : "false") << "\n";
    file << "large_file = " << (m_config.large_file ? "true" : "false") << "\n";
    file << "entity_id_width = " << m_config.entity_id_width << "\n";
    file << "seq_num_width = " << m_config.seq_num_width << "\n\n";

    file << "# Logging\n";
    file << "log_file = " << m_config.log_file << "\n";
    file << "log_level = " << m_config.log_level << "\n";

    return true;
}

} // namespace cfdp::utils
