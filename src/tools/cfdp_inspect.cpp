#include "cfdp/pdu_factory.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

#include <cctype>
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::cout << "CFDP PDU inspector\n";
    std::cout << "Usage: " << program << " [options] <hex bytes...>\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>   Load configuration from file\n";
    std::cout << "  -v, --verbose         Log at trace level\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "\n";
    std::cout << "Example:\n";
    std::cout << "  " << program << " 20 00 03 22 00 02 00 01 00 03 06 51 02\n";
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

// Accepts "2000" as well as "20 00" and "0x20 0x00"
bool parseHex(const std::vector<std::string>& args, std::vector<uint8_t>& out) {
    std::string digits;
    for (const auto& arg : args) {
        std::string token = arg;
        if (token.size() > 2 && token[0] == '0' && (token[1] == 'x' || token[1] == 'X')) {
            token = token.substr(2);
        }
        for (char c : token) {
            if (c == ':' || c == ',') continue;
            if (hexValue(c) < 0) return false;
            digits += c;
        }
    }
    if (digits.size() % 2 != 0) {
        return false;
    }
    for (size_t i = 0; i < digits.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(hexValue(digits[i]) << 4 | hexValue(digits[i + 1])));
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile;
    bool verbose = false;
    std::vector<std::string> hexArgs;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
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
            hexArgs.push_back(arg);
        }
    }

    auto& config = cfdp::utils::Config::instance();
    bool configLoaded = configFile.empty() || config.loadFromFile(configFile);

    const auto& codecConfig = config.getCodecConfig();
    auto level = verbose ? spdlog::level::trace : spdlog::level::from_str(codecConfig.log_level);
    cfdp::utils::Logger::init(codecConfig.log_file, level);

    if (!configLoaded) {
        LOG_WARN("Failed to load config file: {}", configFile);
    }

    if (hexArgs.empty()) {
        printUsage(argv[0]);
        cfdp::utils::Logger::shutdown();
        return 1;
    }

    std::vector<uint8_t> raw;
    if (!parseHex(hexArgs, raw)) {
        LOG_ERROR("Input is not a valid hex byte sequence");
        cfdp::utils::Logger::shutdown();
        return 1;
    }

    int status = 0;
    try {
        cfdp::PduHolder holder = cfdp::PduFactory::fromRaw(raw);
        LOG_INFO("{} ({} bytes)", holder.kindName(), raw.size());
        LOG_INFO("{}", holder.toString());
    }
    catch (const std::exception& ex) {
        LOG_ERROR("Failed to decode PDU [{}]: {}", cfdp::utils::toHex(raw), ex.what());
        status = 1;
    }

    cfdp::utils::Logger::shutdown();
    return status;
}
