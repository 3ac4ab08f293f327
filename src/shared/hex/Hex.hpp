#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace strata::shared::hex
{

// -----------------------------------------------------------------------------
// hex_dump(data, max_len)
//  - "AA BB CC " style; max_len == 0 dumps everything.
// -----------------------------------------------------------------------------
inline std::string hex_dump(std::span<const std::byte> data, size_t max_len = 64)
{
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0');

  const size_t take = (max_len > 0) ? (std::min)(max_len, data.size()) : data.size();

  for (size_t i = 0; i < take; ++i)
  {
    const auto v = static_cast<unsigned int>(std::to_integer<unsigned char>(data[i]));
    oss << std::setw(2) << v << ' ';
  }

  if (take < data.size())
  {
    oss << "...(" << data.size() << " bytes total)";
  }

  return oss.str();
}

// -----------------------------------------------------------------------------
// to_hex(value, width)
// -----------------------------------------------------------------------------
template <class UInt>
inline std::string to_hex(UInt value, int width = -1)
{
  static_assert(std::is_unsigned<UInt>::value, "to_hex requires an unsigned integer type");

  if (width < 0) width = static_cast<int>(sizeof(UInt) * 2);

  std::ostringstream oss;
  oss << "0x" << std::uppercase << std::hex << std::setw(width) << std::setfill('0')
      << static_cast<unsigned long long>(value);
  return oss.str();
}

// -----------------------------------------------------------------------------
// make_line(tag, span, max)
// -----------------------------------------------------------------------------
inline std::string make_line(std::string_view tag, std::span<const std::byte> sp, size_t max = 32)
{
  std::string line;
  line.reserve(64 + max * 3);
  line.append(tag).append(" n=").append(std::to_string(sp.size())).append(": ");
  line += hex_dump(sp, max);
  return line;
}

// -----------------------------------------------------------------------------
// parse_hex(text)
//  - Accepts "45000014", "45 00 00 14", "45:00:00:14" and an optional leading 0x.
//  - Returns nullopt on a non-hex character or an odd digit count.
// -----------------------------------------------------------------------------
inline std::optional<std::vector<std::byte>> parse_hex(std::string_view text)
{
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    text.remove_prefix(2);

  auto nibble = [](char c) -> int
  {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };

  std::vector<std::byte> out;
  out.reserve(text.size() / 2);
  int high = -1;
  for (char c : text)
  {
    if (std::isspace(static_cast<unsigned char>(c)) || c == ':')
    {
      if (high >= 0) return std::nullopt;  // split inside a byte
      continue;
    }
    const int n = nibble(c);
    if (n < 0) return std::nullopt;
    if (high < 0)
    {
      high = n;
    }
    else
    {
      out.push_back(static_cast<std::byte>((high << 4) | n));
      high = -1;
    }
  }
  if (high >= 0) return std::nullopt;
  return out;
}

}  // namespace strata::shared::hex
