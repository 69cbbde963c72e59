// crusty/basic/log.cpp - Logger implementation
#include "crusty/basic/log.hpp"

#include <fmt/ostream.h>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace crusty::log
{

const char * level_name(LogLevel level) noexcept
{
  switch (level) {
    case LogLevel::Trace:
      return "TRACE";
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Off:
      return "OFF";
  }
  return "???";
}

std::optional<LogLevel> parse_level(std::string_view s)
{
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lower == "trace") return LogLevel::Trace;
  if (lower == "debug") return LogLevel::Debug;
  if (lower == "info") return LogLevel::Info;
  if (lower == "warn" || lower == "warning") return LogLevel::Warn;
  if (lower == "error") return LogLevel::Error;
  if (lower == "off") return LogLevel::Off;
  return std::nullopt;
}

Logger & Logger::instance()
{
  static Logger logger;
  return logger;
}

void Logger::set_sink(std::ostream * sink)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  sink_ = sink;
}

void Logger::write(LogLevel level, std::string_view module, std::string_view message)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  std::ostream & os = sink_ != nullptr ? *sink_ : std::cerr;
  fmt::print(os, "[{} {}] {}\n", level_name(level), module, message);
}

}  // namespace crusty::log
