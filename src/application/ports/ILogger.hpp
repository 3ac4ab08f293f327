#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "domain/Settings.hpp"

namespace strata::application::ports
{

enum class LogLevel
{
  trace,
  debug,
  info,
  warn,
  err,
  critical,
  off
};

inline std::optional<LogLevel> parse_log_level(std::string_view text)
{
  if (text == "trace") return LogLevel::trace;
  if (text == "debug") return LogLevel::debug;
  if (text == "info") return LogLevel::info;
  if (text == "warn" || text == "warning") return LogLevel::warn;
  if (text == "err" || text == "error") return LogLevel::err;
  if (text == "critical") return LogLevel::critical;
  if (text == "off") return LogLevel::off;
  return std::nullopt;
}

struct ILogger
{
  virtual ~ILogger() = default;
  virtual void init(const strata::domain::Settings& s) = 0;
  virtual void app(LogLevel level, const std::string& msg) = 0;
  virtual void decode(LogLevel level, std::string_view msg) = 0;
};

}  // namespace strata::application::ports
