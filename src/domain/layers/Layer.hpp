#pragma once

#include <cstddef>
#include <span>
#include <string>

#include "domain/layers/LayerType.hpp"

namespace strata::domain::layers
{

// The one failure kind of the engine. The cause text is owned by whichever
// decoder reported it ("truncated ethernet header", "unsupported link type", ...).
struct DecodeError
{
  std::string cause;

  bool operator==(const DecodeError&) const = default;
};

// One parsed protocol unit. The payload span borrows from the buffer owned by
// the Packet that produced the layer and must not outlive it.
class Layer
{
 public:
  virtual ~Layer() = default;

  virtual LayerType type() const noexcept = 0;
  virtual std::span<const std::byte> payload() const noexcept = 0;
};

class ErrorLayer : public Layer
{
 public:
  virtual const DecodeError& error() const noexcept = 0;
};

}  // namespace strata::domain::layers
