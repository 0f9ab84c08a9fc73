#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace courier::crypto {

using bytes = std::vector<std::uint8_t>;

inline constexpr std::size_t key_size = 32;
inline constexpr std::size_t signature_size = 64;

using key32 = std::array<std::uint8_t, key_size>;
using signature_t = std::array<std::uint8_t, signature_size>;

[[nodiscard]] inline auto is_zero(std::span<const std::uint8_t> data) -> bool
{
  return std::ranges::all_of(data, [](std::uint8_t byte) { return byte == 0; });
}

[[nodiscard]] inline auto to_bytes(std::string_view text) -> bytes { return { text.begin(), text.end() }; }

[[nodiscard]] inline auto to_string(std::span<const std::uint8_t> data) -> std::string
{
  return { data.begin(), data.end() };
}

/// Copies exactly key_size bytes; returns false if data has another length.
[[nodiscard]] inline auto copy_key(std::span<const std::uint8_t> data, key32 &out) -> bool
{
  if (data.size() != key_size) { return false; }
  std::ranges::copy(data, out.begin());
  return true;
}

[[nodiscard]] auto to_hex(std::span<const std::uint8_t> data) -> std::string;

}// namespace courier::crypto
