#pragma once

#include <array>
#include <crypto/bytes.hpp>
#include <cstdint>
#include <optional>
#include <span>

namespace courier::crypto::group {

inline constexpr std::size_t tag_size = 8;
inline constexpr std::size_t credential_size = tag_size + signature_size;

/**
 * @brief Membership credential issued by a group owner to one contact.
 *
 * The group is identified by its public key. A credential is a random tag plus the
 * owner's signature over the group key and the tag; the tag lets the owner tell
 * which contact presented it without the delivery server learning anything.
 */
struct member_credential
{
  std::array<std::uint8_t, tag_size> tag{};
  signature_t signature{};

  [[nodiscard]] auto tag_value() const -> std::uint64_t;
  [[nodiscard]] auto serialize() const -> bytes;

  friend auto operator==(const member_credential &, const member_credential &) -> bool = default;
};

/// Public descriptor of the group owned by this private key.
[[nodiscard]] auto descriptor(const key32 &group_private) -> key32;

/// Issues a fresh credential with a random tag.
[[nodiscard]] auto issue(const key32 &group_private) -> member_credential;

/**
 * @brief Parses a group descriptor.
 *
 * @return std::nullopt if the descriptor has the wrong length or is not a valid key
 */
[[nodiscard]] auto parse_descriptor(std::span<const std::uint8_t> data) -> std::optional<key32>;

/**
 * @brief Parses a credential and checks that it belongs to the group.
 *
 * @return std::nullopt if the credential is malformed or was not issued by the group owner
 */
[[nodiscard]] auto parse_credential(const key32 &group_public, std::span<const std::uint8_t> data)
  -> std::optional<member_credential>;

}// namespace courier::crypto::group
