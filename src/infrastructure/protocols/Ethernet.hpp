#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "application/ports/IDecoder.hpp"
#include "application/services/decode/DecoderTable.hpp"
#include "application/services/decode/LinkTypeRegistry.hpp"
#include "domain/layers/Layer.hpp"

namespace strata::infrastructure::protocols
{

inline constexpr domain::layers::LayerType EthernetType{2};
inline constexpr std::size_t kEthernetHeaderLen = 14;
inline constexpr const char* kTruncatedEthernet = "truncated ethernet header";

using MacAddress = std::array<uint8_t, 6>;

class EthernetLayer final : public domain::layers::Layer
{
 public:
  EthernetLayer(std::span<const std::byte> header, std::span<const std::byte> payload) noexcept;

  domain::layers::LayerType type() const noexcept override { return EthernetType; }
  std::span<const std::byte> payload() const noexcept override { return payload_; }

  std::span<const std::byte> header() const noexcept { return header_; }
  const MacAddress& dst() const noexcept { return dst_; }
  const MacAddress& src() const noexcept { return src_; }
  uint16_t ethertype() const noexcept { return ethertype_; }

 private:
  std::span<const std::byte> header_;
  std::span<const std::byte> payload_;
  MacAddress dst_{};
  MacAddress src_{};
  uint16_t ethertype_{0};
};

// EtherType -> decoder for what follows the Ethernet header. Unregistered
// EtherTypes fall back to PayloadDecoder().
using EtherTypeRegistry = application::services::decode::DecoderTable<uint16_t>;

class EthernetDecoder final : public application::ports::IDecoder
{
 public:
  explicit EthernetDecoder(const EtherTypeRegistry& ethertypes) : ethertypes_(ethertypes) {}

  application::ports::DecodeResult decode(std::span<const std::byte> data,
                                          domain::layers::SpecificLayers& out) const override;

 private:
  const EtherTypeRegistry& ethertypes_;
};

// Process-wide EtherType table used by the registered Ethernet decoder.
EtherTypeRegistry& ethertype_registry();

// Registers Ethernet under LinkType::Ethernet and names its layer type.
void register_ethernet(application::services::decode::LinkTypeRegistry& registry);

// Installs every protocol module shipped with strata.
void register_builtin_protocols(application::services::decode::LinkTypeRegistry& registry);

}  // namespace strata::infrastructure::protocols
