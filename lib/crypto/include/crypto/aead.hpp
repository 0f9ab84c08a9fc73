#pragma once

#include <crypto/bytes.hpp>
#include <optional>
#include <span>

namespace courier::crypto::aead {

inline constexpr std::size_t nonce_size = 12;
inline constexpr std::size_t tag_size = 16;
inline constexpr std::size_t overhead = nonce_size + tag_size;

/**
 * @brief AES-256-GCM encryption under a fresh random nonce.
 *
 * @return nonce || ciphertext || tag
 */
[[nodiscard]] auto seal(const key32 &key,
  std::span<const std::uint8_t> plaintext,
  std::span<const std::uint8_t> associated_data = {}) -> bytes;

/**
 * @brief Reverses seal().
 *
 * @return std::nullopt if the input is truncated or fails authentication
 */
[[nodiscard]] auto open(const key32 &key,
  std::span<const std::uint8_t> sealed,
  std::span<const std::uint8_t> associated_data = {}) -> std::optional<bytes>;

}// namespace courier::crypto::aead
