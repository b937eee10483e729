#pragma once

#include <cstddef>
#include <string>

namespace cfdp::utils {

/**
 * Process-wide codec defaults, picked up by PduConfig::defaultConfig()
 */
struct CodecConfig {
    bool crc_flag = false;
    bool large_file = false;
    size_t entity_id_width = 1;
    size_t seq_num_width = 2;

    std::string log_file = "cfdp-codec.log";
    std::string log_level = "debug";
};

/**
 * Configuration manager
 *
 * Loads and saves the codec defaults as "key = value" lines.
 */
class Config {
public:
    static Config& instance();

    // Load config from file, false if it can not be opened
    bool loadFromFile(const std::string& path);

    // Save config to file
    bool saveToFile(const std::string& path) const;

    const CodecConfig& getCodecConfig() const { return m_config; }
    CodecConfig& getCodecConfig() { return m_config; }

    void setCrcFlag(bool enabled) { m_config.crc_flag = enabled; }
    void setLargeFile(bool enabled) { m_config.large_file = enabled; }
    // Widths must be 1, 2, 4 or 8; throws cfdp::RangeError otherwise
    void setEntityIdWidth(size_t width);
    void setSeqNumWidth(size_t width);

    void reset() { m_config = CodecConfig{}; }

private:
    Config() = default;
    CodecConfig m_config;
};

} // namespace cfdp::utils
