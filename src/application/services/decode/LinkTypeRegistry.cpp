#include "application/services/decode/LinkTypeRegistry.hpp"

#include "application/services/decode/BaselineDecoders.hpp"

namespace strata::application::services::decode
{

LinkTypeRegistry::LinkTypeRegistry() : DecoderTable<domain::LinkType>(UnknownDecoder()) {}

LinkTypeRegistry& LinkTypeRegistry::global()
{
  static LinkTypeRegistry instance;
  return instance;
}

}  // namespace strata::application::services::decode
