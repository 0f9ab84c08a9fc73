#pragma once

#include <crypto/bytes.hpp>
#include <model/contact.hpp>
#include <model/message_record.hpp>
#include <optional>
#include <span>

namespace courier::lifecycle {

/**
 * @brief Seals records with a key derived from the contact's DH ratchet.
 *
 * Layout: sender DH public (32) || AES-256-GCM(nonce || ciphertext || tag).
 * The key is HKDF-SHA256 over X25519(sender scalar, recipient public), salted with
 * both public values. The recipient tries its current scalar, then its previous one.
 */
class ratchet_sealer
{
public:
  /**
   * @throws core::defect_error if the contact has no ratchet state to seal with
   */
  [[nodiscard]] auto seal(const model::contact &peer, const model::message_record &record) const -> crypto::bytes;

  [[nodiscard]] auto unseal(model::contact &peer, std::span<const std::uint8_t> sealed) const
    -> std::optional<model::message_record>;
};

}// namespace courier::lifecycle
