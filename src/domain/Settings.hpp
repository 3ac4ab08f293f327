#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "domain/LinkType.hpp"

namespace strata::domain
{

enum class DecodeMode
{
  Lazy,
  Eager
};

struct Settings
{
  struct Decode
  {
    DecodeMode mode{DecodeMode::Lazy};
    LinkType linkType{LinkType::Ethernet};
    std::size_t maxSteps{0};  // 0 = unlimited
    std::size_t hexDumpBytes{32};
  } decode;

  // Console / Logs
  bool showConsole{false};
  bool saveLog{true};
  bool saveDecodeLog{true};
  std::string level{"info"};
  std::string logsDir{"logs"};
  std::string appLogFilename{"strata_app.log"};
  std::string decodeLogFilename{"strata_decode.log"};
  std::string configPath{"strata.toml"};
};

}  // namespace strata::domain
