#pragma once

#include <crypto/bytes.hpp>
#include <crypto/ed25519.hpp>
#include <cstdint>
#include <string>

namespace courier::model {

/**
 * @brief Long-term key material of the local user.
 */
struct identity
{
  crypto::ed25519::keypair signing;///< Signs key exchanges
  crypto::key32 identity_private{};///< Curve25519 value authenticating us to our server
  crypto::key32 identity_public{};
  crypto::key32 group_private{};///< Issues member credentials to contacts
  std::uint32_t generation{ 0 };///< Bumped when a member credential is revoked
  std::string server;///< Home server address

  /// Creates a new identity with fresh keys.
  [[nodiscard]] static auto create(std::string server) -> identity;

  friend auto operator==(const identity &, const identity &) -> bool = default;
};

}// namespace courier::model
