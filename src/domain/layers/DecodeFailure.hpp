#pragma once

#include <utility>

#include "domain/layers/Layer.hpp"

namespace strata::domain::layers
{

// Terminal layer synthesized when a decoder reports failure. Its payload is
// the span that was handed to the failing decoder.
class DecodeFailure final : public ErrorLayer
{
 public:
  DecodeFailure(std::span<const std::byte> data, DecodeError err)
      : data_(data), err_(std::move(err))
  {
  }

  LayerType type() const noexcept override { return DecodeFailureType; }
  std::span<const std::byte> payload() const noexcept override { return data_; }
  const DecodeError& error() const noexcept override { return err_; }

 private:
  std::span<const std::byte> data_;
  DecodeError err_;
};

}  // namespace strata::domain::layers
