#include <crypto/bytes.hpp>

#include <fmt/format.h>
#include <iterator>

namespace courier::crypto {

auto to_hex(std::span<const std::uint8_t> data) -> std::string
{
  std::string out;
  out.reserve(data.size() * 2);
  for (const auto byte : data) { fmt::format_to(std::back_inserter(out), "{:02x}", byte); }
  return out;
}

}// namespace courier::crypto
