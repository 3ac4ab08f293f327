#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include "domain/layers/Layer.hpp"
#include "domain/layers/SpecificLayers.hpp"

namespace strata::application::ports
{

struct IDecoder;

// Outcome of a single decode step.
//  - error set: everything else is ignored and a DecodeFailure layer is appended.
//  - otherwise: `layer` is the produced layer, `next` the decoder for `remaining`.
//    A null `next` or an empty `remaining` ends the chain.
struct DecodeResult
{
  std::optional<domain::layers::DecodeError> error;
  std::unique_ptr<domain::layers::Layer> layer;
  const IDecoder* next = nullptr;
  std::span<const std::byte> remaining;

  static DecodeResult failure(std::string cause)
  {
    DecodeResult r;
    r.error = domain::layers::DecodeError{std::move(cause)};
    return r;
  }
};

// Decodes one layer off the front of `data`. A decoder may point exactly one
// slot of `out` at the layer it produced; it must not touch anything else, so
// running it again on the same bytes with fresh slots gives the same result.
struct IDecoder
{
  virtual ~IDecoder() = default;
  virtual DecodeResult decode(std::span<const std::byte> data,
                              domain::layers::SpecificLayers& out) const = 0;
};

// Stateless decoder backed by a plain function.
class DecoderFunc final : public IDecoder
{
 public:
  using Fn = DecodeResult (*)(std::span<const std::byte>, domain::layers::SpecificLayers&);

  explicit DecoderFunc(Fn fn) noexcept : fn_(fn) {}

  DecodeResult decode(std::span<const std::byte> data,
                      domain::layers::SpecificLayers& out) const override
  {
    return fn_(data, out);
  }

 private:
  Fn fn_;
};

}  // namespace strata::application::ports
