#include "infrastructure/config/Config_Toml.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <exception>
#include <cstdint>
#include <fstream>
#include <optional>
#include <toml++/toml.hpp>

#include "application/ports/ILogger.hpp"

using strata::domain::DecodeMode;
using strata::domain::Settings;
namespace fs = boost::filesystem;

namespace strata::infrastructure::config
{

namespace
{
constexpr const char* kDefaultLogsDir = "logs";
constexpr const char* kDefaultAppLog = "strata_app.log";
constexpr const char* kDefaultDecodeLog = "strata_decode.log";
constexpr const char* kDefaultLevel = "info";

const char* mode_name(DecodeMode m)
{
  return m == DecodeMode::Eager ? "eager" : "lazy";
}

std::optional<DecodeMode> parse_mode(const std::string& text)
{
  if (text == "lazy") return DecodeMode::Lazy;
  if (text == "eager") return DecodeMode::Eager;
  return std::nullopt;
}
}  // namespace

std::string Config_Toml::link_type_literal(domain::LinkType t)
{
  if (auto name = domain::link_type_name(t)) return "\"" + std::string(*name) + "\"";
  return std::to_string(domain::to_underlying(t));
}

void Config_Toml::write_default(const fs::path& path, Settings& s)
{
  if (path.has_parent_path()) fs::create_directories(path.parent_path());
  std::ofstream out(path.string());

  // Header
  out << "# strata.toml - Auto-generated initial configuration\n"
         "# Edit as needed and restart the application\n\n";

  // [decode]
  out << "[decode]\n";
  out << "mode         = \"" << mode_name(s.decode.mode) << "\"   # lazy | eager\n";
  out << "linkType     = " << link_type_literal(s.decode.linkType) << "\n";
  out << "maxSteps     = " << s.decode.maxSteps << "   # 0 = unlimited\n";
  out << "hexDumpBytes = " << s.decode.hexDumpBytes << "\n\n";

  // [logging]
  out << "[logging]\n";
  out << "showConsole       = " << (s.showConsole ? "true" : "false") << "\n";
  out << "saveLog           = " << (s.saveLog ? "true" : "false") << "\n";
  out << "saveDecodeLog     = " << (s.saveDecodeLog ? "true" : "false") << "\n";
  out << "level             = \"" << kDefaultLevel << "\"\n";
  out << "logsDir           = \"" << kDefaultLogsDir << "\"\n";
  out << "appLogFilename    = \"" << kDefaultAppLog << "\"\n";
  out << "decodeLogFilename = \"" << kDefaultDecodeLog << "\"\n";

  out.close();

  // mirror useful defaults back to Settings
  s.level = kDefaultLevel;
  s.logsDir = kDefaultLogsDir;
  s.appLogFilename = kDefaultAppLog;
  s.decodeLogFilename = kDefaultDecodeLog;
}

Settings Config_Toml::load_or_create(const std::string& configPath)
{
  Settings s;
  s.configPath = configPath;
  const fs::path path{configPath};

  if (!fs::exists(path))
  {
    write_default(path, s);
    return s;
  }

  toml::table tbl;
  try
  {
    tbl = toml::parse_file(path.string());
  }
  catch (const std::exception&)
  {
    // if parsing fails, recreate with defaults
    write_default(path, s);
    return s;
  }

  // ---------------------------
  // [decode]
  // ---------------------------
  if (auto dec = tbl["decode"].as_table())
  {
    if (auto v = (*dec)["mode"].value<std::string>())
    {
      if (auto m = parse_mode(*v)) s.decode.mode = *m;
    }

    // linkType accepts a name or a plain LINKTYPE number
    if (auto v = (*dec)["linkType"].value<std::string>())
    {
      if (auto t = domain::parse_link_type(*v)) s.decode.linkType = *t;
    }
    else if (auto n = (*dec)["linkType"].value<int64_t>(); n && *n >= 0)
    {
      s.decode.linkType = static_cast<domain::LinkType>(*n);
    }

    if (auto v = (*dec)["maxSteps"].value<int64_t>(); v && *v >= 0)
      s.decode.maxSteps = static_cast<std::size_t>(*v);

    if (auto v = (*dec)["hexDumpBytes"].value<int64_t>(); v && *v >= 0)
      s.decode.hexDumpBytes = static_cast<std::size_t>(*v);
  }

  // ---------------------------
  // [logging]
  // ---------------------------
  if (auto log = tbl["logging"].as_table())
  {
    if (auto v = (*log)["showConsole"].value<bool>()) s.showConsole = *v;
    if (auto v = (*log)["saveLog"].value<bool>()) s.saveLog = *v;
    if (auto v = (*log)["saveDecodeLog"].value<bool>()) s.saveDecodeLog = *v;
    if (auto v = (*log)["level"].value<std::string>()) s.level = *v;
    if (auto v = (*log)["logsDir"].value<std::string>()) s.logsDir = *v;
    if (auto v = (*log)["appLogFilename"].value<std::string>()) s.appLogFilename = *v;
    if (auto v = (*log)["decodeLogFilename"].value<std::string>()) s.decodeLogFilename = *v;
  }

  if (!application::ports::parse_log_level(s.level)) s.level = kDefaultLevel;
  if (s.logsDir.empty()) s.logsDir = kDefaultLogsDir;
  if (s.appLogFilename.empty()) s.appLogFilename = kDefaultAppLog;
  if (s.decodeLogFilename.empty()) s.decodeLogFilename = kDefaultDecodeLog;

  return s;
}

}  // namespace strata::infrastructure::config
