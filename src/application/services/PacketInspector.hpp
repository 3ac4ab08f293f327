#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/services/decode/LinkTypeRegistry.hpp"
#include "application/services/decode/Packet.hpp"
#include "domain/Settings.hpp"

namespace strata::application::services
{

struct InspectionReport
{
  std::size_t bytes{0};
  std::vector<std::string> layers;     // layer type names, in chain order
  std::optional<std::string> failure;  // cause of the trailing error layer
  std::optional<std::size_t> applicationBytes;
};

// Decodes buffers with the configured mode and link type and writes what it
// found to the "decode" log channel.
class PacketInspector
{
 public:
  PacketInspector(ports::ILogger& logger, const domain::Settings& s,
                  const decode::LinkTypeRegistry& registry = decode::LinkTypeRegistry::global())
      : log_(logger), cfg_(s), registry_(registry)
  {
  }

  decode::Packet make_packet(std::span<const std::byte> data) const;

  InspectionReport inspect(std::span<const std::byte> data);
  InspectionReport inspect(std::span<const std::byte> data, domain::LinkType link_type);

  // Reports on a packet the caller already holds; a Lazy packet is decoded
  // to completion in place.
  InspectionReport inspect(const decode::Packet& pkt);

  uint64_t inspected() const noexcept { return packets_; }

 private:
  ports::ILogger& log_;
  const domain::Settings& cfg_;
  const decode::LinkTypeRegistry& registry_;
  uint64_t packets_{0};
};

}  // namespace strata::application::services
