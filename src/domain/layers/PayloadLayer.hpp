#pragma once

#include "domain/layers/Layer.hpp"

namespace strata::domain::layers
{

// Bytes nobody could (or wanted to) decode further, kept verbatim.
class PayloadLayer final : public Layer
{
 public:
  explicit PayloadLayer(std::span<const std::byte> data) noexcept : data_(data) {}

  LayerType type() const noexcept override { return PayloadType; }
  std::span<const std::byte> payload() const noexcept override { return data_; }

 private:
  std::span<const std::byte> data_;
};

}  // namespace strata::domain::layers
