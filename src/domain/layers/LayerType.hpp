#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace strata::domain::layers
{

// Open enumeration of layer kinds. Protocol modules pick their own tag values
// and name them through LayerTypeCatalog at registration time.
struct LayerType
{
  uint16_t value{0};

  constexpr bool operator==(const LayerType&) const = default;
};

inline constexpr LayerType DecodeFailureType{0};
inline constexpr LayerType PayloadType{1};

// Process-wide tag -> name table. Append-only; a later name for the same tag wins.
class LayerTypeCatalog
{
 public:
  static LayerTypeCatalog& global();

  void register_name(LayerType t, std::string name);
  std::string name_of(LayerType t) const;

 private:
  LayerTypeCatalog();

  std::unordered_map<uint16_t, std::string> names_;
};

inline std::string to_string(LayerType t)
{
  return LayerTypeCatalog::global().name_of(t);
}

}  // namespace strata::domain::layers
