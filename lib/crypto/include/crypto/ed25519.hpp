#pragma once

#include <crypto/bytes.hpp>
#include <span>

namespace courier::crypto::ed25519 {

struct keypair
{
  key32 public_key{};
  key32 private_key{};///< RFC 8032 seed

  friend auto operator==(const keypair &, const keypair &) -> bool = default;
};

[[nodiscard]] auto generate() -> keypair;

[[nodiscard]] auto public_from_private(const key32 &private_key) -> key32;

/**
 * @brief Signs a message.
 *
 * @throws core::defect_error if the primitive fails
 */
[[nodiscard]] auto sign(const key32 &private_key, std::span<const std::uint8_t> message) -> signature_t;

/**
 * @brief Verifies a signature.
 *
 * @return false on a bad signature, a public key that is not a valid point, or wrong input lengths
 */
[[nodiscard]] auto verify(std::span<const std::uint8_t> public_key,
  std::span<const std::uint8_t> message,
  std::span<const std::uint8_t> signature) -> bool;

}// namespace courier::crypto::ed25519
