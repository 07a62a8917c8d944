/**
 * @file log.cpp
 * @brief probelink diagnostic logging implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "probelink/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace probe
{
namespace link
{

namespace
{

void stderr_sink(void* /*user*/, LogLevel level, const char* message)
{
  std::fprintf(stderr, "[probelink] %-5s %s\n", log_level_name(level), message);
}

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_sink_mutex;
LogSinkFn g_sink = stderr_sink;
void* g_sink_user = nullptr;

}  // namespace

void set_log_sink(LogSinkFn sink, void* user)
{
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = sink ? sink : stderr_sink;
  g_sink_user = sink ? user : nullptr;
}

void set_log_level(LogLevel level)
{
  g_level.store(level);
}

LogLevel log_level()
{
  return g_level.load();
}

bool log_enabled(LogLevel level)
{
  return level != LogLevel::NONE && level >= g_level.load();
}

void log_message(LogLevel level, const char* fmt, ...)
{
  if (!log_enabled(level))
  {
    return;
  }

  char message[512];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(message, sizeof(message), fmt, args);
  va_end(args);

  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink(g_sink_user, level, message);
}

std::string hex_string(const uint8_t* data, size_t len)
{
  static const char digits[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(len * 3);
  for (size_t i = 0; i < len; ++i)
  {
    if (i > 0)
    {
      out.push_back(' ');
    }
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

const char* log_level_name(LogLevel level)
{
  switch (level)
  {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::NONE:
      break;
  }
  return "NONE";
}

}  // namespace link
}  // namespace probe
