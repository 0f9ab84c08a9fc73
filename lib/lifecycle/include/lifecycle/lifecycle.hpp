#pragma once

#include <concepts/sealer.hpp>
#include <core/errors.hpp>
#include <core/events.hpp>
#include <crypto/group.hpp>
#include <crypto/x25519.hpp>
#include <cstddef>
#include <cstdint>
#include <lifecycle/usage.hpp>
#include <model/message_record.hpp>
#include <model/session_state.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace courier::lifecycle {

/**
 * @brief Builds a record for an active contact.
 *
 * The size bound is checked on the serialized form before the contact's ratchet is
 * touched, so a rejected draft leaves the session unchanged. An empty body is
 * replaced by a single space.
 *
 * @throws std::system_error unknown_contact, contact_pending or message_too_large
 */
auto compose(model::session_state &state,
  std::uint64_t contact_id,
  const std::string &body,
  const std::vector<model::attachment> &attachments,
  std::optional<std::uint64_t> in_reply_to,
  std::int64_t now) -> model::message_record;

/**
 * @brief Builds a zero-body acknowledgement record, using the same DH rotation as compose().
 */
auto compose_ack(model::session_state &state, std::uint64_t contact_id, std::uint64_t in_reply_to, std::int64_t now)
  -> model::message_record;

/**
 * @brief Marks an outbound message as accepted by the server.
 *
 * @return false if no outbound message has this id
 */
auto mark_sent(model::session_state &state, std::uint64_t outbound_id, std::int64_t now) -> bool;

/**
 * @brief Marks an outbound message as acknowledged by its recipient.
 *
 * An unsent message is marked sent at the same time.
 *
 * @return false if no outbound message has this id
 */
auto acknowledge(model::session_state &state, std::uint64_t outbound_id, std::int64_t now) -> bool;

/**
 * @brief Marks a decoded inbound message as read.
 *
 * @throws std::system_error unknown_message or contact_pending
 */
auto mark_read(model::session_state &state, std::uint64_t inbound_id) -> model::inbound_message &;

/**
 * @brief Seals a composed record and appends it to the outbox and the transmission queue.
 */
template<concepts::sealer Sealer>
auto enqueue(model::session_state &state,
  Sealer &sealer,
  std::uint64_t contact_id,
  model::message_record record,
  std::int64_t now) -> model::outbound_message &
{
  auto *peer = state.find_contact(contact_id);
  if (peer == nullptr) { throw core::defect_error("enqueue: contact vanished"); }

  model::outbound_message outbound{ .id = record.id,
    .to = contact_id,
    .server = peer->their_server,
    .created = now,
    .sent = 0,
    .acked = 0,
    .record = std::move(record),
    .sealed = {} };
  outbound.sealed = sealer.seal(*peer, outbound.record);

  state.queue->enqueue(core::events::delivery{ .id = outbound.id,
    .to = contact_id,
    .server = peer->their_server,
    .to_identity = crypto::bytes(peer->their_identity_public.begin(), peer->their_identity_public.end()),
    .credential = peer->received_credential,
    .generation = peer->generation,
    .payload = outbound.sealed });

  state.outbox.push_back(std::move(outbound));
  return state.outbox.back();
}

/**
 * @brief Composes and enqueues a message to a contact.
 */
template<concepts::sealer Sealer>
auto send_message(model::session_state &state,
  Sealer &sealer,
  std::uint64_t contact_id,
  const std::string &body,
  const std::vector<model::attachment> &attachments,
  std::int64_t now) -> model::outbound_message &
{
  auto record = compose(state, contact_id, body, attachments, std::nullopt, now);
  return enqueue(state, sealer, contact_id, std::move(record), now);
}

/**
 * @brief Answers an inbound message and marks it acknowledged.
 *
 * @throws std::system_error unknown_message, contact_pending or message_too_large
 */
template<concepts::sealer Sealer>
auto reply(model::session_state &state,
  Sealer &sealer,
  std::uint64_t inbound_id,
  const std::string &body,
  const std::vector<model::attachment> &attachments,
  std::int64_t now) -> model::outbound_message &
{
  auto *inbound = state.find_inbound(inbound_id);
  if (inbound == nullptr) { core::raise(core::errc::unknown_message); }
  const auto *decoded = inbound->record();
  if (decoded == nullptr) { core::raise(core::errc::contact_pending); }

  const auto contact_id = inbound->from;
  auto record = compose(state, contact_id, body, attachments, decoded->id, now);
  inbound->acked = true;
  return enqueue(state, sealer, contact_id, std::move(record), now);
}

/**
 * @brief Sends an empty acknowledgement for an inbound message and marks it acked.
 *
 * @throws std::system_error unknown_message or contact_pending
 */
template<concepts::sealer Sealer>
auto ack_inbound(model::session_state &state, Sealer &sealer, std::uint64_t inbound_id, std::int64_t now)
  -> model::outbound_message &
{
  auto *inbound = state.find_inbound(inbound_id);
  if (inbound == nullptr) { core::raise(core::errc::unknown_message); }
  const auto *decoded = inbound->record();
  if (decoded == nullptr) { core::raise(core::errc::contact_pending); }

  const auto contact_id = inbound->from;
  auto record = compose_ack(state, contact_id, decoded->id, now);
  inbound->acked = true;
  return enqueue(state, sealer, contact_id, std::move(record), now);
}

/**
 * @brief Decodes messages held while a contact was pending.
 *
 * Messages that fail to unseal and empty acknowledgement carriers are removed;
 * the rest keep their id and timestamps. No sealed message from the contact remains.
 *
 * @return Number of messages decoded
 */
template<concepts::sealer Sealer>
auto unseal_on_handshake_complete(model::session_state &state,
  Sealer &sealer,
  std::uint64_t contact_id,
  std::int64_t now) -> std::size_t
{
  auto *peer = state.find_contact(contact_id);
  if (peer == nullptr) { throw core::defect_error("unseal: contact vanished"); }

  std::size_t decoded_count = 0;
  std::vector<std::uint64_t> acked_outbound;
  std::erase_if(state.inbox, [&](model::inbound_message &msg) {
    if (msg.from != contact_id or not msg.is_sealed()) { return false; }

    auto record = sealer.unseal(*peer, std::get<model::sealed_payload>(msg.content).ciphertext);
    if (not record) {
      spdlog::warn("[lifecycle] Discarding held message {:016x} from {}: cannot unseal", msg.id, peer->name);
      return true;
    }
    if (not crypto::x25519::is_usable_public(record->my_next_dh)) {
      spdlog::warn("[lifecycle] Discarding held message {:016x} from {}: unusable DH value", msg.id, peer->name);
      return true;
    }

    peer->ratchet.observe_remote(record->my_next_dh);
    if (record->in_reply_to) { acked_outbound.push_back(*record->in_reply_to); }
    if (record->body.empty()) { return true; }

    msg.content = std::move(*record);
    ++decoded_count;
    return false;
  });

  for (const auto outbound_id : acked_outbound) { acknowledge(state, outbound_id, now); }
  return decoded_count;
}

/// What absorb_fetched did with a record
struct absorb_result
{
  enum class outcome : std::uint8_t { rejected, stale, held_sealed, acknowledgement, stored };

  outcome result{ outcome::rejected };
  std::uint64_t contact_id{ 0 };
  std::optional<std::uint64_t> inbound_id;///< Set when a message was added to the inbox
  std::optional<std::uint64_t> acked_outbound;///< Outbound message this record acknowledged
};

/**
 * @brief Applies a record fetched from the server to the session.
 *
 * The sender is identified by the member credential we issued to it. Records from a
 * pending contact are held sealed.
 */
template<concepts::sealer Sealer>
auto absorb_fetched(model::session_state &state,
  Sealer &sealer,
  const core::events::fetched_record &fetched,
  std::int64_t now) -> absorb_result
{
  using outcome = absorb_result::outcome;

  const auto group_public = crypto::group::descriptor(state.self.group_private);
  const auto credential = crypto::group::parse_credential(group_public, fetched.credential);
  if (not credential) {
    spdlog::warn("[lifecycle] Dropping fetched record with invalid group credential");
    return { .result = outcome::rejected };
  }
  if (fetched.generation < state.self.generation) {
    spdlog::info("[lifecycle] Dropping fetched record from stale generation {}", fetched.generation);
    return { .result = outcome::stale };
  }

  auto *peer = state.find_contact_by_tag(credential->tag_value());
  if (peer == nullptr) {
    spdlog::warn("[lifecycle] Dropping fetched record: credential matches no contact");
    return { .result = outcome::rejected };
  }

  if (peer->pending) {
    const auto id = state.fresh_message_id();
    state.inbox.push_back(model::inbound_message{ .id = id,
      .read = false,
      .received = now,
      .from = peer->id,
      .acked = false,
      .content = model::sealed_payload{ .ciphertext = fetched.payload } });
    return { .result = outcome::held_sealed, .contact_id = peer->id, .inbound_id = id };
  }

  auto record = sealer.unseal(*peer, fetched.payload);
  if (not record) {
    spdlog::warn("[lifecycle] Dropping message from {}: cannot unseal", peer->name);
    return { .result = outcome::rejected, .contact_id = peer->id };
  }
  if (not crypto::x25519::is_usable_public(record->my_next_dh)) {
    spdlog::warn("[lifecycle] Dropping message from {}: unusable DH value", peer->name);
    return { .result = outcome::rejected, .contact_id = peer->id };
  }

  peer->ratchet.observe_remote(record->my_next_dh);

  absorb_result result{ .result = outcome::acknowledgement, .contact_id = peer->id };
  if (record->in_reply_to and acknowledge(state, *record->in_reply_to, now)) {
    result.acked_outbound = record->in_reply_to;
  }
  if (record->body.empty()) { return result; }

  const auto id = state.fresh_message_id();
  state.inbox.push_back(model::inbound_message{
    .id = id, .read = false, .received = now, .from = peer->id, .acked = false, .content = std::move(*record) });
  result.result = outcome::stored;
  result.inbound_id = id;
  return result;
}

}// namespace courier::lifecycle
