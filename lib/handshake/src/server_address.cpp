#include <handshake/server_address.hpp>

#include <charconv>
#include <crypto/armor.hpp>
#include <fmt/format.h>
#include <limits>

namespace courier::handshake {

namespace {

  constexpr std::string_view onion_suffix{ ".onion" };

}// namespace

auto parse_server(std::string_view text, bool allow_any_host) -> std::optional<server_address>
{
  if (not text.starts_with(server_scheme)) { return std::nullopt; }
  text.remove_prefix(server_scheme.size());

  const auto at = text.find('@');
  if (at == std::string_view::npos) { return std::nullopt; }

  server_address address;
  const auto key = crypto::base32_decode(text.substr(0, at));
  if (not key or not crypto::copy_key(*key, address.key)) { return std::nullopt; }

  auto host_port = text.substr(at + 1);
  const auto colon = host_port.rfind(':');
  if (colon != std::string_view::npos) {
    const auto port_text = host_port.substr(colon + 1);
    unsigned value = 0;
    const auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
    const bool parsed = ec == std::errc{} and ptr == port_text.data() + port_text.size();
    if (not parsed or value == 0 or value > std::numeric_limits<std::uint16_t>::max()) {
      return std::nullopt;
    }
    address.port = static_cast<std::uint16_t>(value);
    host_port = host_port.substr(0, colon);
  }

  if (host_port.empty() or host_port.find_first_of("/@ ") != std::string_view::npos) { return std::nullopt; }
  if (not allow_any_host and not host_port.ends_with(onion_suffix)) { return std::nullopt; }

  address.host = std::string(host_port);
  return address;
}

auto format_server(const server_address &address) -> std::string
{
  if (address.port == default_server_port) {
    return fmt::format("{}{}@{}", server_scheme, crypto::base32_encode(address.key), address.host);
  }
  return fmt::format("{}{}@{}:{}", server_scheme, crypto::base32_encode(address.key), address.host, address.port);
}

}// namespace courier::handshake
