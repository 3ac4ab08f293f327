#include "infrastructure/protocols/Ethernet.hpp"

#include <algorithm>
#include <memory>

#include "application/services/decode/BaselineDecoders.hpp"

namespace strata::infrastructure::protocols
{
using application::ports::DecodeResult;
using domain::layers::LayerTypeCatalog;
using domain::layers::SpecificLayers;
namespace decode = application::services::decode;

namespace
{
MacAddress read_mac(std::span<const std::byte> p)
{
  MacAddress mac{};
  std::transform(p.begin(), p.begin() + mac.size(), mac.begin(),
                 [](std::byte b) { return std::to_integer<uint8_t>(b); });
  return mac;
}
}  // namespace

EthernetLayer::EthernetLayer(std::span<const std::byte> header,
                             std::span<const std::byte> payload) noexcept
    : header_(header),
      payload_(payload),
      dst_(read_mac(header.subspan(0, 6))),
      src_(read_mac(header.subspan(6, 6))),
      ethertype_(static_cast<uint16_t>((std::to_integer<uint16_t>(header[12]) << 8) |
                                       std::to_integer<uint16_t>(header[13])))
{
}

DecodeResult EthernetDecoder::decode(std::span<const std::byte> data, SpecificLayers& out) const
{
  if (data.size() < kEthernetHeaderLen) return DecodeResult::failure(kTruncatedEthernet);

  auto eth = std::make_unique<EthernetLayer>(data.first(kEthernetHeaderLen),
                                             data.subspan(kEthernetHeaderLen));
  DecodeResult r;
  r.next = &ethertypes_.lookup(eth->ethertype());
  r.remaining = eth->payload();
  out.link = eth.get();
  r.layer = std::move(eth);
  return r;
}

EtherTypeRegistry& ethertype_registry()
{
  static EtherTypeRegistry instance{decode::PayloadDecoder()};
  return instance;
}

void register_ethernet(decode::LinkTypeRegistry& registry)
{
  static const EthernetDecoder decoder{ethertype_registry()};
  LayerTypeCatalog::global().register_name(EthernetType, "Ethernet");
  registry.register_decoder(domain::LinkType::Ethernet, decoder);
}

void register_builtin_protocols(decode::LinkTypeRegistry& registry)
{
  register_ethernet(registry);
}

}  // namespace strata::infrastructure::protocols
