#include <iostream>
#include <string>

#include "application/services/Bootstrap.hpp"
#include "application/services/PacketInspector.hpp"
#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"
#include "infrastructure/protocols/Ethernet.hpp"
#include "shared/hex/Hex.hpp"

namespace app = strata::application::services;

// strata-cli [config.toml] [hex bytes...]
// Every remaining argument is one packet in hex, e.g. "ffffffffffff 000000000001 0800 4500".
int main(int argc, char** argv) {
  std::string configPath = (argc > 1) ? argv[1] : std::string{"strata.toml"};

  strata::infrastructure::config::Config_Toml   cfg_impl;
  strata::infrastructure::logging::Logger_Spdlog log_impl;

  app::Bootstrap boot{cfg_impl, log_impl, app::decode::LinkTypeRegistry::global(),
                      &strata::infrastructure::protocols::register_builtin_protocols};
  const auto settings = boot.run(configPath);

  if (argc <= 2) {
    std::cout << "strata CLI up. Edit " << configPath << " and pass packets as hex arguments.\n";
    return 0;
  }

  app::PacketInspector inspector{log_impl, settings};
  int rc = 0;
  for (int i = 2; i < argc; ++i) {
    auto bytes = strata::shared::hex::parse_hex(argv[i]);
    if (!bytes) {
      std::cerr << "argument " << i << ": not a hex byte string\n";
      rc = 2;
      continue;
    }

    const auto pkt = inspector.make_packet(*bytes);
    std::cout << pkt.describe() << "\n";
    inspector.inspect(pkt);
    if (pkt.error_layer() && rc == 0) rc = 1;
  }
  return rc;
}
