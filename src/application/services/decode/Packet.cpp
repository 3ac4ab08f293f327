#include "application/services/decode/Packet.hpp"

#include <sstream>
#include <utility>

namespace strata::application::services::decode
{
using domain::layers::ErrorLayer;
using domain::layers::Layer;
using domain::layers::LayerType;
using domain::layers::SpecificLayers;

Packet::Packet(std::vector<std::byte> data, domain::LinkType link_type, DecodeMode mode,
               const LinkTypeRegistry& registry, PacketOptions options)
    : buffer_(std::move(data)),
      link_type_(link_type),
      mode_(mode),
      cursor_(registry.lookup(link_type), buffer_, options.max_steps)
{
  if (mode_ == DecodeMode::Eager) cursor_.run();
}

Packet::Packet(std::span<const std::byte> data, domain::LinkType link_type, DecodeMode mode,
               const LinkTypeRegistry& registry, PacketOptions options)
    : Packet(std::vector<std::byte>(data.begin(), data.end()), link_type, mode, registry,
             options)
{
}

DecodeState Packet::state() const noexcept
{
  if (cursor_.finished()) return DecodeState::FullyDecoded;
  if (cursor_.steps() == 0) return DecodeState::Unstarted;
  return DecodeState::PartiallyDecoded;
}

const LayerChain& Packet::layers() const
{
  cursor_.run();
  return cursor_.chain();
}

const Layer* Packet::layer(LayerType t) const
{
  const Layer* found = nullptr;
  std::size_t scanned = 0;
  cursor_.run_until(
      [&]
      {
        const auto& chain = cursor_.chain();
        for (; scanned < chain.size(); ++scanned)
        {
          if (chain[scanned]->type() == t)
          {
            found = chain[scanned].get();
            return true;
          }
        }
        return false;
      });
  return found;
}

const Layer* Packet::link_layer() const
{
  return slot(&SpecificLayers::link);
}

const Layer* Packet::network_layer() const
{
  return slot(&SpecificLayers::network);
}

const Layer* Packet::transport_layer() const
{
  return slot(&SpecificLayers::transport);
}

const Layer* Packet::application_layer() const
{
  return slot(&SpecificLayers::application);
}

const ErrorLayer* Packet::error_layer() const
{
  cursor_.run();
  return cursor_.specific().error;
}

std::string Packet::describe() const
{
  const auto& chain = layers();

  std::ostringstream oss;
  oss << "PACKET: " << buffer_.size() << " bytes, " << to_string(link_type_) << ", "
      << chain.size() << " layer(s)";

  for (std::size_t i = 0; i < chain.size(); ++i)
  {
    const Layer& l = *chain[i];
    oss << "\n- Layer " << (i + 1) << ": " << to_string(l.type()) << ", "
        << l.payload().size() << " payload bytes";
    if (const auto* e = dynamic_cast<const ErrorLayer*>(&l)) oss << " (" << e->error().cause << ")";
  }
  return oss.str();
}

}  // namespace strata::application::services::decode
