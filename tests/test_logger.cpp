#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"

using strata::application::ports::LogLevel;
using strata::domain::Settings;
using strata::infrastructure::logging::Logger_Spdlog;
namespace fs = boost::filesystem;

static fs::path tmp_dir(const std::string& name)
{
  auto dir = fs::temp_directory_path() / ("strata-logs-" + name);
  fs::remove_all(dir);
  return dir;
}

TEST(LoggerSpdlog, CreatesFilesAndIsIdempotent)
{
  Settings s;
  auto dir = tmp_dir("smoke");
  s.logsDir = dir.string();
  s.appLogFilename = "app.log";
  s.decodeLogFilename = "decode.log";
  s.showConsole = false;
  s.saveLog = true;
  s.saveDecodeLog = true;

  Logger_Spdlog log;
  EXPECT_NO_THROW(log.init(s));
  EXPECT_NO_THROW(log.app(LogLevel::info, "hello app"));
  EXPECT_NO_THROW(log.decode(LogLevel::info, "hello decode"));

  EXPECT_TRUE(fs::exists(dir / "app.log"));
  EXPECT_TRUE(fs::exists(dir / "decode.log"));

  EXPECT_NO_THROW(log.init(s));
  EXPECT_NO_THROW(log.set_level(LogLevel::warn));
}

TEST(LoggerSpdlog, DisabledFileSinksCreateNothing)
{
  Settings s;
  auto dir = tmp_dir("disabled");
  s.logsDir = dir.string();
  s.saveLog = false;
  s.saveDecodeLog = false;

  Logger_Spdlog log;
  EXPECT_NO_THROW(log.init(s));
  EXPECT_NO_THROW(log.app(LogLevel::err, "nowhere to go"));
  EXPECT_FALSE(fs::exists(dir));
}

TEST(LoggerSpdlog, UninitializedLoggerIgnoresMessages)
{
  Logger_Spdlog log;
  EXPECT_NO_THROW(log.app(LogLevel::info, "dropped"));
  EXPECT_NO_THROW(log.decode(LogLevel::info, "dropped"));
}

TEST(LogLevel, ParsesKnownNames)
{
  using strata::application::ports::parse_log_level;
  EXPECT_EQ(parse_log_level("debug"), LogLevel::debug);
  EXPECT_EQ(parse_log_level("warning"), LogLevel::warn);
  EXPECT_EQ(parse_log_level("error"), LogLevel::err);
  EXPECT_FALSE(parse_log_level("chatty").has_value());
}
