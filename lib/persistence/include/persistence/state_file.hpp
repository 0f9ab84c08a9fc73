#pragma once

#include <crypto/bytes.hpp>
#include <crypto/kdf.hpp>
#include <filesystem>
#include <model/session_state.hpp>
#include <span>
#include <string_view>

namespace courier::persistence {

inline constexpr std::size_t salt_size = 32;

/**
 * @brief Key protecting the state file.
 *
 * An empty passphrase yields the all-zero key without running scrypt, so an
 * unprotected state file opens without prompting.
 */
[[nodiscard]] auto derive_key(std::string_view passphrase,
  std::span<const std::uint8_t> salt,
  const crypto::kdf::scrypt_params &params = {}) -> crypto::key32;

/**
 * @brief Encrypts a snapshot: salt || nonce || ciphertext || tag.
 *
 * @throws std::invalid_argument if the salt is not salt_size bytes
 */
[[nodiscard]] auto seal_state(const crypto::key32 &key,
  std::span<const std::uint8_t> salt,
  std::span<const std::uint8_t> snapshot) -> crypto::bytes;

/**
 * @brief Salt stored at the head of a state file.
 *
 * @throws std::system_error corrupt_state if the file is too short
 */
[[nodiscard]] auto read_salt(std::span<const std::uint8_t> file) -> crypto::bytes;

/**
 * @brief Decrypts a state file to its snapshot bytes.
 *
 * @throws std::system_error incorrect_passphrase if authentication fails, corrupt_state if truncated
 */
[[nodiscard]] auto open_state(const crypto::key32 &key, std::span<const std::uint8_t> file) -> crypto::bytes;

/**
 * @brief Decrypts and parses a state file.
 *
 * @throws std::system_error incorrect_passphrase or corrupt_state
 */
[[nodiscard]] auto load(std::span<const std::uint8_t> file, const crypto::key32 &key) -> model::session_state;

/// Reads a whole file. Throws std::filesystem::filesystem_error on failure.
[[nodiscard]] auto read_file(const std::filesystem::path &path) -> crypto::bytes;

/**
 * @brief Replaces a file by writing a sibling temporary and renaming it over the target.
 *
 * The temporary and the containing directory are synced, so the new contents survive
 * a power loss once this returns.
 *
 * @throws std::filesystem::filesystem_error on failure; the target is left as it was
 */
auto write_file_atomic(const std::filesystem::path &path, std::span<const std::uint8_t> contents) -> void;

}// namespace courier::persistence
