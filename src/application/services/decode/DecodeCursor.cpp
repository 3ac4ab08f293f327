#include "application/services/decode/DecodeCursor.hpp"

#include <utility>

#include "domain/layers/DecodeFailure.hpp"

namespace strata::application::services::decode
{
using domain::layers::DecodeError;
using domain::layers::DecodeFailure;
using domain::layers::SpecificLayers;

DecodeCursor::DecodeCursor(const ports::IDecoder& first, std::span<const std::byte> data,
                           std::size_t max_steps) noexcept
    : next_(&first), pending_(data), max_steps_(max_steps)
{
}

bool DecodeCursor::step()
{
  if (next_ == nullptr) return false;

  const auto data = pending_;
  if (max_steps_ != 0 && steps_ >= max_steps_)
  {
    fail(data, DecodeError{kStepLimitExceeded});
    return true;
  }

  const ports::IDecoder* current = next_;
  next_ = nullptr;
  pending_ = {};
  ++steps_;

  // Slots are committed only on success so a failing decoder cannot leave a
  // slot pointing at a layer that is about to be dropped.
  SpecificLayers scratch = specific_;
  ports::DecodeResult r = current->decode(data, scratch);

  if (r.error)
  {
    fail(data, std::move(*r.error));
    return true;
  }

  specific_ = scratch;
  if (r.layer) chain_.push_back(std::move(r.layer));

  if (r.next != nullptr && !r.remaining.empty())
  {
    next_ = r.next;
    pending_ = r.remaining;
  }
  return true;
}

void DecodeCursor::run()
{
  while (step())
  {
  }
}

void DecodeCursor::fail(std::span<const std::byte> data, DecodeError err)
{
  auto layer = std::make_unique<DecodeFailure>(data, std::move(err));
  specific_.error = layer.get();
  chain_.push_back(std::move(layer));
  next_ = nullptr;
  pending_ = {};
}

}  // namespace strata::application::services::decode
