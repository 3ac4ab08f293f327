#pragma once

#include <cstddef>
#include <type_traits>
#include <unordered_map>

#include "application/ports/IDecoder.hpp"

namespace strata::application::services::decode
{

namespace detail
{
template <typename K, bool = std::is_enum_v<K>>
struct raw_key
{
  using type = K;
};

template <typename K>
struct raw_key<K, true>
{
  using type = std::underlying_type_t<K>;
};
}  // namespace detail

// Key -> decoder map with a fallback for keys nobody registered, so lookup
// never fails. Decoders are borrowed and must outlive the table.
//
// Registration must happen-before any lookup; once populated, concurrent
// lookups are safe because nothing mutates the map any more.
template <typename Key>
class DecoderTable
{
 public:
  explicit DecoderTable(const ports::IDecoder& fallback) : fallback_(&fallback) {}

  // Adds or replaces the decoder for `key`; the last registration wins.
  void register_decoder(Key key, const ports::IDecoder& decoder)
  {
    decoders_[raw(key)] = &decoder;
  }

  const ports::IDecoder& lookup(Key key) const
  {
    if (auto it = decoders_.find(raw(key)); it != decoders_.end()) return *it->second;
    return *fallback_;
  }

  bool contains(Key key) const { return decoders_.count(raw(key)) != 0; }
  std::size_t size() const noexcept { return decoders_.size(); }

 private:
  using Raw = typename detail::raw_key<Key>::type;

  static constexpr Raw raw(Key key) noexcept { return static_cast<Raw>(key); }

  const ports::IDecoder* fallback_;
  std::unordered_map<Raw, const ports::IDecoder*> decoders_;
};

}  // namespace strata::application::services::decode
