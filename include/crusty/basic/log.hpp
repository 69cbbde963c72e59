// crusty/basic/log.hpp - Levelled, module-tagged logging
//
//   CRUSTY_LOG_DEBUG("sema", "registered alias '{}'", name);
//   CRUSTY_LOG_INFO("driver", "wrote {}", path.string());
//
// Messages below the current threshold are never formatted.
//
#pragma once

#include <fmt/core.h>

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace crusty::log
{

enum class LogLevel : uint8_t {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Off = 5,
};

[[nodiscard]] const char * level_name(LogLevel level) noexcept;

/// Parse "trace" .. "off" (case-insensitive). Unknown names yield nullopt.
[[nodiscard]] std::optional<LogLevel> parse_level(std::string_view s);

/**
 * Process-wide log dispatcher.
 *
 * Writes `[LEVEL module] message` lines to a sink stream (stderr unless
 * replaced). Thread-safe.
 */
class Logger
{
public:
  static Logger & instance();

  [[nodiscard]] bool should_log(LogLevel level) const noexcept
  {
    return level != LogLevel::Off && level >= level_;
  }

  void set_level(LogLevel level) noexcept { level_ = level; }
  [[nodiscard]] LogLevel level() const noexcept { return level_; }

  /// Redirect output. Passing nullptr restores stderr.
  void set_sink(std::ostream * sink);

  void write(LogLevel level, std::string_view module, std::string_view message);

private:
  Logger() = default;

  LogLevel level_ = LogLevel::Warn;
  std::ostream * sink_ = nullptr;
  std::mutex mutex_;
};

template <typename... Args>
void emit(LogLevel level, std::string_view module, fmt::string_view format, const Args &... args)
{
  auto & logger = Logger::instance();
  if (!logger.should_log(level)) {
    return;
  }
  logger.write(level, module, fmt::vformat(format, fmt::make_format_args(args...)));
}

}  // namespace crusty::log

#define CRUSTY_LOG_TRACE(module, ...) \
  ::crusty::log::emit(::crusty::log::LogLevel::Trace, module, __VA_ARGS__)
#define CRUSTY_LOG_DEBUG(module, ...) \
  ::crusty::log::emit(::crusty::log::LogLevel::Debug, module, __VA_ARGS__)
#define CRUSTY_LOG_INFO(module, ...) \
  ::crusty::log::emit(::crusty::log::LogLevel::Info, module, __VA_ARGS__)
#define CRUSTY_LOG_WARN(module, ...) \
  ::crusty::log::emit(::crusty::log::LogLevel::Warn, module, __VA_ARGS__)
#define CRUSTY_LOG_ERROR(module, ...) \
  ::crusty::log::emit(::crusty::log::LogLevel::Error, module, __VA_ARGS__)
