#include "domain/LinkType.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace strata::domain
{

std::optional<std::string_view> link_type_name(LinkType t)
{
  switch (t)
  {
    case LinkType::Null:     return "null";
    case LinkType::Ethernet: return "ethernet";
    case LinkType::Raw:      return "raw";
    case LinkType::LinuxSll: return "linux_sll";
  }
  return std::nullopt;
}

std::string to_string(LinkType t)
{
  if (auto name = link_type_name(t)) return std::string(*name);
  return "linktype(" + std::to_string(to_underlying(t)) + ")";
}

std::optional<LinkType> parse_link_type(std::string_view text)
{
  std::string s(text);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (s == "null") return LinkType::Null;
  if (s == "ethernet" || s == "eth") return LinkType::Ethernet;
  if (s == "raw") return LinkType::Raw;
  if (s == "linux_sll" || s == "sll") return LinkType::LinuxSll;

  uint32_t value = 0;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (s.empty() || ec != std::errc{} || ptr != last) return std::nullopt;
  return static_cast<LinkType>(value);
}

}  // namespace strata::domain
