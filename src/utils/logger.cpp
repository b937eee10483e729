#include "utils/logger.hpp"

#include <cstdio>

namespace cfdp::utils {

std::shared_ptr<spdlog::logger> Logger::s_logger;

void Logger::init(const std::string& logFile, spdlog::level::level_enum level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::debug);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 1024 * 1024 * 5, 3); // 5MB, 3 files
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        s_logger = std::make_shared<spdlog::logger>("cfdp",
            spdlog::sinks_init_list{console_sink, file_sink});

        s_logger->set_level(level);
        s_logger->flush_on(spdlog::level::warn);

        spdlog::register_logger(s_logger);
        spdlog::set_default_logger(s_logger);

        s_logger->debug("Logger initialized, writing to {}", logFile);
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "Logger init failed: %s\n", ex.what());
        s_logger.reset();
    }
}

void Logger::shutdown() {
    if (s_logger) {
        s_logger->flush();
        s_logger.reset();
    }
    spdlog::shutdown();
}

} // namespace cfdp::utils
