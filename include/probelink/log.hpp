/**
 * @file log.hpp
 * @brief probelink diagnostic logging
 *
 * printf-style logging with a process-wide level and a replaceable sink.
 * The default sink writes one line per message to stderr.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace probe
{
namespace link
{

/**
 * @brief Message severity, in increasing order
 */
enum class LogLevel : uint8_t
{
  DEBUG = 0,
  INFO = 1,
  WARN = 2,
  ERROR = 3,
  NONE = 4,  ///< Only valid as a threshold, disables all output
};

/**
 * @brief Log sink callback type
 *
 * @param user    User context pointer passed to set_log_sink()
 * @param level   Severity of the message
 * @param message Formatted message without trailing newline
 */
using LogSinkFn = void (*)(void* user, LogLevel level, const char* message);

/**
 * @brief Replace the log sink
 *
 * @param sink Callback, or nullptr to restore the stderr sink
 * @param user User context pointer passed to @p sink
 */
void set_log_sink(LogSinkFn sink, void* user = nullptr);

/**
 * @brief Set the minimum level that reaches the sink (default: INFO)
 */
void set_log_level(LogLevel level);

/**
 * @brief Current minimum level
 */
LogLevel log_level();

/**
 * @brief Check whether a message at @p level would be emitted
 */
bool log_enabled(LogLevel level);

/**
 * @brief Format and emit a message
 */
void log_message(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

/**
 * @brief Render bytes as space separated upper-case hex ("FF F9 00 02")
 */
std::string hex_string(const uint8_t* data, size_t len);

/**
 * @brief Name of a level ("DEBUG", "INFO", ...)
 */
const char* log_level_name(LogLevel level);

}  // namespace link
}  // namespace probe

#define PROBELINK_LOG_D(...) ::probe::link::log_message(::probe::link::LogLevel::DEBUG, __VA_ARGS__)
#define PROBELINK_LOG_I(...) ::probe::link::log_message(::probe::link::LogLevel::INFO, __VA_ARGS__)
#define PROBELINK_LOG_W(...) ::probe::link::log_message(::probe::link::LogLevel::WARN, __VA_ARGS__)
#define PROBELINK_LOG_E(...) ::probe::link::log_message(::probe::link::LogLevel::ERROR, __VA_ARGS__)
