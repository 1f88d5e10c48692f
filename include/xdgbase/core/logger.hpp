#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace xdgbase {

/// Process logger. Writes to stderr so that tool output on stdout stays clean.
class Logger {
public:
    static void init(std::string_view name = "xdgbase", std::string_view level = "warn");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace xdgbase

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::xdgbase::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::xdgbase::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::xdgbase::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::xdgbase::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::xdgbase::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::xdgbase::Logger::get(), __VA_ARGS__)
