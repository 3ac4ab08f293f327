#include "infrastructure/logging/Logger_Spdlog.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>

#include <boost/filesystem.hpp>
#include <vector>
#include <chrono>

namespace fs = boost::filesystem;
using strata::application::ports::LogLevel;

namespace strata::infrastructure::logging {

// -------------------------------------------------------------------------------------------------
// map_level
//  - Converts ports::LogLevel to spdlog's native level enum.
// -------------------------------------------------------------------------------------------------
spdlog::level::level_enum Logger_Spdlog::map_level(LogLevel l) {
  switch (l) {
    case LogLevel::trace:    return spdlog::level::trace;
    case LogLevel::debug:    return spdlog::level::debug;
    case LogLevel::info:     return spdlog::level::info;
    case LogLevel::warn:     return spdlog::level::warn;
    case LogLevel::err:      return spdlog::level::err;
    case LogLevel::critical: return spdlog::level::critical;
    case LogLevel::off:      return spdlog::level::off;
  }
  return spdlog::level::info;
}

static void configure_console_colors_(const std::shared_ptr<spdlog::sinks::ansicolor_stdout_sink_mt>& sink) {
  sink->set_color(spdlog::level::trace,    "\x1b[90m");
  sink->set_color(spdlog::level::debug,    "\x1b[36m");
  sink->set_color(spdlog::level::info,     "\x1b[32m");
  sink->set_color(spdlog::level::warn,     "\x1b[33m");
  sink->set_color(spdlog::level::err,      "\x1b[31m");
  sink->set_color(spdlog::level::critical, "\x1b[35m");
}

// -------------------------------------------------------------------------------------------------
// init(settings)
//  - "app" carries lifecycle/config messages, "decode" carries per-packet layer dumps.
//  - Each channel gets a rotating file sink when enabled, plus the colored
//    console sink when settings.showConsole is true.
//  - Loggers are async; a channel with no sink at all still exists and drops everything.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::init(const strata::domain::Settings& s) {
  const fs::path dir        = s.logsDir.empty() ? fs::path{"logs"} : fs::path{s.logsDir};
  const fs::path appPath    = dir / (s.appLogFilename.empty()    ? "strata_app.log"    : s.appLogFilename);
  const fs::path decodePath = dir / (s.decodeLogFilename.empty() ? "strata_decode.log" : s.decodeLogFilename);

  // Re-init safety: drop old named loggers if they exist
  if (auto prev = spdlog::get("app"))    spdlog::drop(prev->name());
  if (auto prev = spdlog::get("decode")) spdlog::drop(prev->name());

  std::vector<spdlog::sink_ptr> app_sinks;
  std::vector<spdlog::sink_ptr> decode_sinks;

  if (s.saveLog || s.saveDecodeLog) {
    boost::system::error_code ec;
    fs::create_directories(dir, ec);
  }

  if (s.saveLog) {
    auto app_file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(appPath.string(), 5 * 1024 * 1024, 3);
    app_file->set_level(spdlog::level::trace);
    app_sinks.push_back(app_file);
  }
  if (s.saveDecodeLog) {
    auto decode_file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(decodePath.string(), 5 * 1024 * 1024, 3);
    decode_file->set_level(spdlog::level::trace);
    decode_sinks.push_back(decode_file);
  }

  if (s.showConsole) {
    auto console_sink = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
    configure_console_colors_(console_sink);
    console_sink->set_level(spdlog::level::debug);
    app_sinks.push_back(console_sink);
    decode_sinks.push_back(console_sink);
  }

  const size_t qsize   = 8192;
  const size_t workers = 1;

  if (!spdlog::thread_pool()) spdlog::init_thread_pool(qsize, workers);
  app_    = std::make_shared<spdlog::async_logger>("app",    app_sinks.begin(),    app_sinks.end(),
               spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  decode_ = std::make_shared<spdlog::async_logger>("decode", decode_sinks.begin(), decode_sinks.end(),
               spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::register_logger(app_);
  spdlog::register_logger(decode_);

  // Only the console renders colors between %^ and %$.
  const char* pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v";
  app_->set_pattern(pattern);
  decode_->set_pattern(pattern);

  const auto level = map_level(strata::application::ports::parse_log_level(s.level).value_or(LogLevel::info));
  app_->set_level(level);
  decode_->set_level(level);

  app_->flush_on(spdlog::level::err);
  decode_->flush_on(spdlog::level::err);
  spdlog::flush_every(std::chrono::seconds(2));
}

void Logger_Spdlog::app(LogLevel level, const std::string& msg) {
  if (app_) app_->log(map_level(level), msg);
}

void Logger_Spdlog::decode(LogLevel level, std::string_view msg) {
  if (decode_) decode_->log(map_level(level), msg);
}

// -------------------------------------------------------------------------------------------------
// set_level(level)
//  - Adjusts both channels at runtime; per-sink levels still apply.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::set_level(LogLevel level) {
  auto lv = map_level(level);
  if (app_)    app_->set_level(lv);
  if (decode_) decode_->set_level(lv);
}

} // namespace strata::infrastructure::logging
