#pragma once

#include "domain/layers/Layer.hpp"

namespace strata::domain::layers
{

// Canonical-role slots filled as a side effect of decoding. Pointers refer to
// layers owned by the same chain; a later write to a slot replaces the earlier one.
struct SpecificLayers
{
  const Layer* link = nullptr;
  const Layer* network = nullptr;
  const Layer* transport = nullptr;
  const Layer* application = nullptr;
  const ErrorLayer* error = nullptr;
};

}  // namespace strata::domain::layers
