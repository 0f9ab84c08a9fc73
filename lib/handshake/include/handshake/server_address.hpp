#pragma once

#include <crypto/bytes.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace courier::handshake {

inline constexpr std::string_view server_scheme{ "courier://" };
inline constexpr std::uint16_t default_server_port = 16333;

/**
 * @brief Delivery server address: courier://<base32 server key>@host[:port]
 */
struct server_address
{
  crypto::key32 key{};
  std::string host;
  std::uint16_t port{ default_server_port };
};

/**
 * @brief Parses and validates a server address.
 *
 * @param text Address string
 * @param allow_any_host Accept hosts that are not onion services
 * @return std::nullopt if the address violates any rule
 */
[[nodiscard]] auto parse_server(std::string_view text, bool allow_any_host) -> std::optional<server_address>;

[[nodiscard]] auto format_server(const server_address &address) -> std::string;

}// namespace courier::handshake
