#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace cfdp::utils {

/**
 * Logger utility
 *
 * Central logging interface on top of spdlog. Until init() runs, messages
 * go to the spdlog default logger, so library code can log from tests and
 * embedding applications without any setup.
 */
class Logger {
public:
    static void init(const std::string& logFile = "cfdp-codec.log",
                     spdlog::level::level_enum level = spdlog::level::debug);
    static void shutdown();

    static std::shared_ptr<spdlog::logger> get() {
        return s_logger ? s_logger : spdlog::default_logger();
    }

    template<typename... Args>
    static void trace(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> s_logger;
};

#define LOG_TRACE(...) cfdp::utils::Logger::trace(__VA_ARGS__)
#define LOG_DEBUG(...) cfdp::utils::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  cfdp::utils::Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  cfdp::utils::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) cfdp::utils::Logger::error(__VA_ARGS__)
#define LOG_CRITICAL(...) cfdp::utils::Logger::critical(__VA_ARGS__)

} // namespace cfdp::utils
