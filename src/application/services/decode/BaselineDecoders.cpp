#include "application/services/decode/BaselineDecoders.hpp"

#include <memory>

#include "domain/layers/PayloadLayer.hpp"

namespace strata::application::services::decode
{
using domain::layers::PayloadLayer;
using domain::layers::SpecificLayers;
using ports::DecodeResult;

namespace
{

DecodeResult decode_unknown(std::span<const std::byte>, SpecificLayers&)
{
  return DecodeResult::failure(kUnsupportedLinkType);
}

DecodeResult decode_payload(std::span<const std::byte> data, SpecificLayers& out)
{
  DecodeResult r;
  auto payload = std::make_unique<PayloadLayer>(data);
  out.application = payload.get();
  r.layer = std::move(payload);
  return r;
}

}  // namespace

const ports::IDecoder& UnknownDecoder()
{
  static const ports::DecoderFunc instance{&decode_unknown};
  return instance;
}

const ports::IDecoder& PayloadDecoder()
{
  static const ports::DecoderFunc instance{&decode_payload};
  return instance;
}

}  // namespace strata::application::services::decode
