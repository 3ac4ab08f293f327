#pragma once
#include <string>
#include <sstream>
#include "application/ports/IConfigProvider.hpp"
#include "application/ports/ILogger.hpp"
#include "application/services/decode/LinkTypeRegistry.hpp"
#include "domain/Settings.hpp"

namespace strata::application::services {

struct Bootstrap {
  ports::IConfigProvider&   cfg;
  ports::ILogger&           log;
  decode::LinkTypeRegistry& registry = decode::LinkTypeRegistry::global();
  void (*install_protocols)(decode::LinkTypeRegistry&) = nullptr;

  static inline const char* b2s(bool b) { return b ? "true" : "false"; }

  // Loads (or creates) the config, brings up logging and lets
  // install_protocols populate the registry. Must complete before the first
  // packet is decoded.
  domain::Settings run(const std::string& configPath) {
    auto s = cfg.load_or_create(configPath);
    log.init(s);

    using ports::LogLevel;

    log.app(LogLevel::info, "strata started");
    log.app(LogLevel::info, std::string("Config file: ") + s.configPath);

    if (install_protocols) install_protocols(registry);
    log.app(LogLevel::info, "Registered link types: " + std::to_string(registry.size()));

    std::ostringstream dec;
    dec << "Decode: mode=" << (s.decode.mode == domain::DecodeMode::Eager ? "eager" : "lazy")
        << " | linkType=" << domain::to_string(s.decode.linkType)
        << " | maxSteps=" << s.decode.maxSteps;
    log.app(LogLevel::info, dec.str());

    if (!registry.contains(s.decode.linkType))
      log.app(LogLevel::warn, "No decoder registered for " + domain::to_string(s.decode.linkType) +
                                  "; packets will decode as unsupported link type");

    std::ostringstream flags;
    flags << "Console: " << b2s(s.showConsole)
          << " | saveLog: " << b2s(s.saveLog)
          << " | saveDecodeLog: " << b2s(s.saveDecodeLog)
          << " | level: " << s.level;
    log.app(LogLevel::info, flags.str());
    return s;
  }
};

} // namespace strata::application::services
