#include "domain/layers/LayerType.hpp"

#include <utility>

namespace strata::domain::layers
{

LayerTypeCatalog::LayerTypeCatalog()
{
  names_[DecodeFailureType.value] = "DecodeFailure";
  names_[PayloadType.value] = "Payload";
}

LayerTypeCatalog& LayerTypeCatalog::global()
{
  static LayerTypeCatalog instance;
  return instance;
}

void LayerTypeCatalog::register_name(LayerType t, std::string name)
{
  names_[t.value] = std::move(name);
}

std::string LayerTypeCatalog::name_of(LayerType t) const
{
  if (auto it = names_.find(t.value); it != names_.end()) return it->second;
  return "LayerType(" + std::to_string(t.value) + ")";
}

}  // namespace strata::domain::layers
