#pragma once

#include "application/services/decode/DecoderTable.hpp"
#include "domain/LinkType.hpp"

namespace strata::application::services::decode
{

// Link type -> first decoder of the chain. Unregistered types resolve to
// UnknownDecoder().
class LinkTypeRegistry : public DecoderTable<domain::LinkType>
{
 public:
  LinkTypeRegistry();

  // Process-wide instance. Populate it explicitly (see
  // register_builtin_protocols) before the first packet is decoded.
  static LinkTypeRegistry& global();
};

}  // namespace strata::application::services::decode
