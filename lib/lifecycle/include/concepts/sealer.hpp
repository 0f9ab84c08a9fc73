#pragma once

#include <concepts>
#include <crypto/bytes.hpp>
#include <model/contact.hpp>
#include <model/message_record.hpp>
#include <optional>
#include <span>

namespace courier::concepts {

/**
 * @brief Symmetric sealing of message records between two contacts.
 *
 * seal() encrypts a record to the contact using the current ratchet state.
 * unseal() reverses it and may record in the ratchet that the peer used our
 * current DH value; it returns std::nullopt for anything it cannot authenticate.
 */
template<typename T>
concept sealer = requires(T &impl,
  const model::contact &peer,
  model::contact &mutable_peer,
  const model::message_record &record,
  std::span<const std::uint8_t> sealed) {
  { impl.seal(peer, record) } -> std::same_as<crypto::bytes>;
  { impl.unseal(mutable_peer, sealed) } -> std::same_as<std::optional<model::message_record>>;
};

}// namespace courier::concepts
