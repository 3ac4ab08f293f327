#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace strata::domain
{

// pcap LINKTYPE_* numbers. Values outside the named set are valid keys too.
enum class LinkType : uint32_t
{
  Null = 0,
  Ethernet = 1,
  Raw = 101,
  LinuxSll = 113
};

constexpr uint32_t to_underlying(LinkType t) noexcept
{
  return static_cast<uint32_t>(t);
}

// Name accepted by parse_link_type, or nullopt for values outside the named set.
std::optional<std::string_view> link_type_name(LinkType t);

std::string to_string(LinkType t);

// Accepts "null", "ethernet", "raw", "linux_sll" (case-insensitive) or a decimal number.
std::optional<LinkType> parse_link_type(std::string_view text);

}  // namespace strata::domain
