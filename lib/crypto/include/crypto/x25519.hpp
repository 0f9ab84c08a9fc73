#pragma once

#include <crypto/bytes.hpp>
#include <optional>
#include <span>

namespace courier::crypto::x25519 {

/// Draws a fresh private scalar.
[[nodiscard]] auto generate_private() -> key32;

/// Scalar base multiplication.
[[nodiscard]] auto public_from_private(const key32 &private_key) -> key32;

/**
 * @brief Computes the shared secret with a peer's public value.
 *
 * @return std::nullopt if the peer value has the wrong length or yields a low-order result
 */
[[nodiscard]] auto shared_secret(const key32 &private_key, std::span<const std::uint8_t> peer_public)
  -> std::optional<key32>;

/**
 * @brief Checks that a peer public value can be used for key agreement.
 *
 * Rejects wrong lengths and the low-order points, whose product with every
 * private scalar is zero.
 */
[[nodiscard]] auto is_usable_public(std::span<const std::uint8_t> peer_public) -> bool;

}// namespace courier::crypto::x25519
