#pragma once

#include <crypto/bytes.hpp>
#include <model/contact.hpp>
#include <model/identity.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace courier::handshake {

inline constexpr std::string_view armor_label{ "COURIER KEY EXCHANGE" };

struct apply_options
{
  bool allow_any_host{ false };///< Accept non-onion server hosts (testing)
};

/**
 * @brief Produces the signed key exchange for a pending contact.
 *
 * Seeds the contact's ratchet, issues it a fresh member credential and stores the
 * serialized record in contact.handshake_bytes. The caller must persist the contact
 * before revealing the record.
 *
 * @return The serialized key exchange
 * @throws core::defect_error if a cryptographic primitive fails
 */
auto generate(model::contact &contact, const model::identity &self) -> crypto::bytes;

/**
 * @brief Validates a peer's key exchange and completes the contact.
 *
 * Either every field is written and pending is cleared, or nothing is touched.
 *
 * @return Empty error_code on success, otherwise the first violated check
 */
[[nodiscard]] auto apply(model::contact &contact,
  std::span<const std::uint8_t> record,
  const apply_options &options = {}) -> std::error_code;

/// Armors a key exchange for copy and paste.
[[nodiscard]] auto armor(std::span<const std::uint8_t> record) -> std::string;

/// Finds the key exchange block in pasted text.
[[nodiscard]] auto dearmor(std::string_view text) -> std::optional<crypto::bytes>;

}// namespace courier::handshake
