#pragma once

#include <crypto/bytes.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace courier::crypto::kdf {

/// Cost parameters for passphrase stretching
struct scrypt_params
{
  std::uint64_t n{ 32768 };
  std::uint64_t r{ 16 };
  std::uint64_t p{ 1 };
};

/**
 * @brief Stretches a passphrase into a 32-byte key with scrypt.
 */
[[nodiscard]] auto scrypt(std::string_view passphrase, std::span<const std::uint8_t> salt, const scrypt_params &params)
  -> key32;

/**
 * @brief HKDF-SHA256 expanding input keying material into a 32-byte key.
 *
 * @param ikm Input keying material, must not be empty
 * @param salt Optional salt
 * @param info Context string binding the key to its use
 */
[[nodiscard]] auto hkdf_sha256(std::span<const std::uint8_t> ikm,
  std::span<const std::uint8_t> salt,
  std::string_view info) -> key32;

}// namespace courier::crypto::kdf
