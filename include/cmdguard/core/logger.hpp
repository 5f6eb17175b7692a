#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cmdguard {

class Logger {
public:
    static void init(std::string_view name = "cmdguard", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();

    /// Maps a level name to the spdlog enum; unknown names map to info.
    static auto parse_level(std::string_view level) -> spdlog::level::level_enum;
};

} // namespace cmdguard

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::cmdguard::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::cmdguard::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::cmdguard::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::cmdguard::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::cmdguard::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::cmdguard::Logger::get(), __VA_ARGS__)
