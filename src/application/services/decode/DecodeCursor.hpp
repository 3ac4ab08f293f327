#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

#include "application/ports/IDecoder.hpp"
#include "domain/layers/Layer.hpp"
#include "domain/layers/SpecificLayers.hpp"

namespace strata::application::services::decode
{

inline constexpr const char* kStepLimitExceeded = "decode step limit exceeded";

using LayerChain = std::vector<std::unique_ptr<domain::layers::Layer>>;

// Drives a chain of decoders over one buffer, one step at a time.
//
// The chain ends when a decoder returns no next decoder, leaves no bytes, or
// fails. A failure becomes a trailing DecodeFailure layer; the bytes after it
// are never looked at. Only the first decoder may see an empty span.
//
// A decoder that keeps returning itself with the same bytes never terminates
// unless `max_steps` is non-zero, in which case the chain is cut off with a
// kStepLimitExceeded failure once that many decoders have run.
class DecodeCursor
{
 public:
  DecodeCursor(const ports::IDecoder& first, std::span<const std::byte> data,
               std::size_t max_steps = 0) noexcept;

  DecodeCursor(DecodeCursor&&) noexcept = default;
  DecodeCursor& operator=(DecodeCursor&&) noexcept = default;
  DecodeCursor(const DecodeCursor&) = delete;
  DecodeCursor& operator=(const DecodeCursor&) = delete;

  // Runs the pending decoder. Returns false when nothing was pending.
  bool step();

  void run();

  // Steps until `done_when()` holds or nothing is pending.
  template <typename Pred>
  void run_until(Pred&& done_when)
  {
    while (!done_when())
    {
      if (!step()) break;
    }
  }

  bool finished() const noexcept { return next_ == nullptr; }
  std::size_t steps() const noexcept { return steps_; }

  const LayerChain& chain() const noexcept { return chain_; }
  const domain::layers::SpecificLayers& specific() const noexcept { return specific_; }

 private:
  void fail(std::span<const std::byte> data, domain::layers::DecodeError err);

  const ports::IDecoder* next_;
  std::span<const std::byte> pending_;
  std::size_t max_steps_;
  std::size_t steps_{0};
  LayerChain chain_;
  domain::layers::SpecificLayers specific_;
};

}  // namespace strata::application::services::decode
