#include <lifecycle/lifecycle.hpp>

#include <fmt/format.h>

namespace courier::lifecycle {

namespace {

  auto active_contact(model::session_state &state, std::uint64_t contact_id) -> model::contact &
  {
    auto *peer = state.find_contact(contact_id);
    if (peer == nullptr) { core::raise(core::errc::unknown_contact); }
    if (peer->pending) { core::raise(core::errc::contact_pending); }
    return *peer;
  }

  auto stamp(model::session_state &state, model::contact &peer, model::message_record record, std::int64_t now)
    -> model::message_record
  {
    record.id = state.fresh_message_id();
    record.time = now;
    record.my_next_dh = peer.ratchet.next_local_public();
    return record;
  }

}// namespace

auto compose(model::session_state &state,
  std::uint64_t contact_id,
  const std::string &body,
  const std::vector<model::attachment> &attachments,
  std::optional<std::uint64_t> in_reply_to,
  std::int64_t now) -> model::message_record
{
  auto &peer = active_contact(state, contact_id);

  auto record = placeholder_record(effective_body(body), in_reply_to.has_value(), attachments);
  record.in_reply_to = in_reply_to;
  if (const auto size = model::serialized_size(record); size > model::max_serialized_message) {
    core::raise(core::errc::message_too_large,
      fmt::format("{} of {} bytes", size, model::max_serialized_message));
  }

  return stamp(state, peer, std::move(record), now);
}

auto compose_ack(model::session_state &state, std::uint64_t contact_id, std::uint64_t in_reply_to, std::int64_t now)
  -> model::message_record
{
  auto &peer = active_contact(state, contact_id);
  model::message_record record;
  record.in_reply_to = in_reply_to;
  return stamp(state, peer, std::move(record), now);
}

auto mark_sent(model::session_state &state, std::uint64_t outbound_id, std::int64_t now) -> bool
{
  auto *outbound = state.find_outbound(outbound_id);
  if (outbound == nullptr) {
    spdlog::warn("[lifecycle] Sent confirmation for unknown message {:016x}", outbound_id);
    return false;
  }
  if (outbound->sent == 0) { outbound->sent = now; }
  return true;
}

auto acknowledge(model::session_state &state, std::uint64_t outbound_id, std::int64_t now) -> bool
{
  auto *outbound = state.find_outbound(outbound_id);
  if (outbound == nullptr) {
    spdlog::warn("[lifecycle] Acknowledgement for unknown message {:016x}", outbound_id);
    return false;
  }
  if (outbound->sent == 0) { outbound->sent = now; }
  if (outbound->acked == 0) { outbound->acked = now; }
  return true;
}

auto mark_read(model::session_state &state, std::uint64_t inbound_id) -> model::inbound_message &
{
  auto *inbound = state.find_inbound(inbound_id);
  if (inbound == nullptr) { core::raise(core::errc::unknown_message); }
  if (inbound->is_sealed()) { core::raise(core::errc::contact_pending); }
  inbound->read = true;
  return *inbound;
}

}// namespace courier::lifecycle
