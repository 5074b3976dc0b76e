/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * Initializes the process-wide spdlog logger with a colour console sink and
 * a rotating file sink under the cache directory. The LOG_* macros attach
 * source location to every record.
 *
 * @section Dependencies
 * - spdlog
 *
 * @section Patterns
 * - Wrapper: Simplifies spdlog usage.
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace smu {

class Logger {
public:
    static void init(std::string_view appName = "screenmu-capture",
                     bool debug = false);
    static void setDebug(bool debug);
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// Use these instead of calling Logger::get() directly

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(smu::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(smu::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(smu::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(smu::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(smu::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) \
    SPDLOG_LOGGER_CRITICAL(smu::Logger::get(), __VA_ARGS__)

} // namespace smu
