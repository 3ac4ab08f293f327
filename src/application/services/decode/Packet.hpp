#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "application/services/decode/DecodeCursor.hpp"
#include "application/services/decode/LinkTypeRegistry.hpp"
#include "domain/LinkType.hpp"
#include "domain/Settings.hpp"
#include "domain/layers/Layer.hpp"

namespace strata::application::services::decode
{

enum class DecodeState
{
  Unstarted,         // nothing decoded yet (Lazy only)
  PartiallyDecoded,  // a prefix of the chain is decoded (Lazy only)
  FullyDecoded       // chain complete; a trailing error layer means it failed
};

struct PacketOptions
{
  std::size_t max_steps{0};  // see DecodeCursor; 0 = unlimited
};

// Raw bytes plus their decoded layer chain.
//
// Eager packets decode everything in the constructor and never change
// afterwards, so any number of threads may read one concurrently.
//
// Lazy packets decode only as far as each accessor needs and cache the
// progress. Every accessor except data()/link_type()/mode() may therefore
// mutate the packet, even through a const reference: a Lazy packet must not be
// used from more than one thread at a time without external locking. Use
// Eager for packets that will be shared.
//
// Both modes produce the same chain and the same slots once fully decoded.
// The slot accessors of a Lazy packet stop at the first decoder that fills the
// slot, so a slot a later decoder would overwrite shows the earlier layer
// until the packet has been decoded further.
class Packet
{
 public:
  using DecodeMode = domain::DecodeMode;

  Packet(std::vector<std::byte> data, domain::LinkType link_type, DecodeMode mode,
         const LinkTypeRegistry& registry = LinkTypeRegistry::global(),
         PacketOptions options = {});

  Packet(std::span<const std::byte> data, domain::LinkType link_type, DecodeMode mode,
         const LinkTypeRegistry& registry = LinkTypeRegistry::global(),
         PacketOptions options = {});

  Packet(Packet&&) noexcept = default;
  Packet& operator=(Packet&&) noexcept = default;
  Packet(const Packet&) = delete;
  Packet& operator=(const Packet&) = delete;

  std::span<const std::byte> data() const noexcept { return buffer_; }
  domain::LinkType link_type() const noexcept { return link_type_; }
  DecodeMode mode() const noexcept { return mode_; }
  DecodeState state() const noexcept;

  // Every layer, in decode order. Decodes the whole packet.
  const LayerChain& layers() const;

  // First layer of type `t`, or nullptr.
  const domain::layers::Layer* layer(domain::layers::LayerType t) const;

  const domain::layers::Layer* link_layer() const;
  const domain::layers::Layer* network_layer() const;
  const domain::layers::Layer* transport_layer() const;
  const domain::layers::Layer* application_layer() const;

  // The trailing DecodeFailure if decoding failed, nullptr otherwise. Decodes
  // the whole packet.
  const domain::layers::ErrorLayer* error_layer() const;

  // Multi-line dump: one header line, then one line per layer.
  std::string describe() const;

 private:
  template <typename Slot>
  const Slot* slot(const Slot* domain::layers::SpecificLayers::*member) const
  {
    cursor_.run_until([&] { return cursor_.specific().*member != nullptr; });
    return cursor_.specific().*member;
  }

  std::vector<std::byte> buffer_;
  domain::LinkType link_type_;
  DecodeMode mode_;
  mutable DecodeCursor cursor_;
};

}  // namespace strata::application::services::decode
