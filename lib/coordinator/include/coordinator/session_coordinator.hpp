#pragma once

#include <algorithm>
#include <async/async_queue.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>
#include <concepts/sealer.hpp>
#include <core/errors.hpp>
#include <core/events.hpp>
#include <core/overload.hpp>
#include <core/processor_runner.hpp>
#include <crypto/bytes.hpp>
#include <cstdint>
#include <functional>
#include <handshake/handshake.hpp>
#include <iterator>
#include <lifecycle/lifecycle.hpp>
#include <lifecycle/usage.hpp>
#include <memory>
#include <model/session_state.hpp>
#include <persistence/snapshot.hpp>
#include <platform/time_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace courier::coordinator {

/**
 * @brief The session owner: the only writer of session state apart from the message queue.
 *
 * Events from the front end and the network actor arrive on one merged queue and are
 * processed one at a time. Every mutation is followed by a save request before any
 * presentation event or network ack goes out. A recoverable failure leaves state
 * untouched and is reported as operation_failed; a defect stops the coordinator
 * after running the shutdown sequence.
 *
 * @tparam Sealer Type satisfying concepts::sealer
 */
template<concepts::sealer Sealer> class session_coordinator
{
public:
  using in_queue_t = async::async_queue<core::events::session_coordinator::in_t>;
  using persistence_queue_t = async::async_queue<core::events::persistence::in_t>;
  using persistence_done_queue_t = async::async_queue<core::events::persistence::out_t>;
  using network_queue_t = async::async_queue<core::events::network::in_t>;
  using presentation_queue_t = async::async_queue<core::events::presentation_event_variant_t>;
  using clock_fn = std::function<std::int64_t()>;

  struct queues_t
  {
    std::shared_ptr<in_queue_t> in;
    std::shared_ptr<persistence_queue_t> persistence;
    std::shared_ptr<persistence_done_queue_t> persistence_done;
    std::shared_ptr<network_queue_t> network;
    std::shared_ptr<presentation_queue_t> presentation;
  };

  session_coordinator(model::session_state state,
    std::shared_ptr<Sealer> sealer,// NOLINT(modernize-pass-by-value)
    queues_t queues,
    handshake::apply_options options = {},
    clock_fn clock = platform::unix_time)
    : state_(std::move(state)), sealer_(std::move(sealer)), queues_(std::move(queues)), options_(options),
      clock_(std::move(clock))
  {}

  session_coordinator(const session_coordinator &) = delete;
  auto operator=(const session_coordinator &) -> session_coordinator & = delete;
  session_coordinator(session_coordinator &&) = delete;
  auto operator=(session_coordinator &&) -> session_coordinator & = delete;
  ~session_coordinator() = default;

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run_once(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    auto evt = co_await queues_.in->pop(cancel_slot);
    co_await std::visit([this](const auto &event) { return dispatch(event); }, evt);
  }

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    cancel_slot_ = cancel_slot;
    bool defect = false;
    try {
      while (not stopping_) { co_await run_once(cancel_slot); }
    } catch (const boost::system::system_error &e) {
      if (not core::is_stop_request(e.code())) {
        spdlog::error("[session_coordinator] Unexpected error in run loop: {}", e.what());
        throw;
      }
      spdlog::debug("[session_coordinator] Cancelled, exiting run loop");
    } catch (const core::defect_error &e) {
      spdlog::critical("[session_coordinator] Internal error, shutting down: {}", e.what());
      defect = true;
    }

    if (defect) { co_await shut_down(); }
  }

  [[nodiscard]] auto state() const -> const model::session_state & { return state_; }

  [[nodiscard]] auto stopped() const -> bool { return stopping_; }

private:
  model::session_state state_;
  std::shared_ptr<Sealer> sealer_;
  queues_t queues_;
  handshake::apply_options options_;
  clock_fn clock_;
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot_;

  bool stopping_{ false };
  bool persistence_stopped_{ false };
  std::uint64_t save_sequence_{ 0 };
  std::uint64_t durable_sequence_{ 0 };

  template<typename Event> auto dispatch(const Event &evt) -> boost::asio::awaitable<void>
  {
    if constexpr (std::is_same_v<Event, core::events::shutdown>) {
      co_await shut_down();
    } else if constexpr (std::is_same_v<Event, core::events::network::new_message>) {
      co_await absorb(evt);
    } else {
      try {
        handle(evt);
      } catch (const std::system_error &e) {
        spdlog::debug("[session_coordinator] {} failed: {}", operation_name(evt), e.what());
        emit(core::events::operation_failed{ .operation = std::string(operation_name(evt)), .error = e.code() });
      }
    }
    drain_completions();
    co_return;
  }

  auto emit(core::events::presentation_event_variant_t evt) -> void
  {
    if (not queues_.presentation->try_push(std::move(evt))) {
      spdlog::debug("[session_coordinator] Presentation queue closed, dropping event");
    }
  }

  auto trigger_network(std::function<void()> on_complete = {}) -> bool
  {
    return queues_.network->try_push(core::events::network::trigger{ .on_complete = std::move(on_complete) });
  }

  /// Requests a write of the current state; returns the sequence number to await.
  auto save() -> std::uint64_t
  {
    const auto sequence = ++save_sequence_;
    if (not queues_.persistence->try_push(
          core::events::persistence::save{ .snapshot = persistence::serialize(state_), .sequence = sequence })) {
      spdlog::error("[session_coordinator] Persistence queue closed, snapshot {} not saved", sequence);
    }
    return sequence;
  }

  auto note_completion(const core::events::persistence::out_t &completion) -> void
  {
    std::visit(core::overload{ [this](const core::events::persistence::written &evt) {
                                durable_sequence_ = std::max(durable_sequence_, evt.sequence);
                              },
                 [this](const core::events::persistence::write_failed &evt) {
                   spdlog::error("[session_coordinator] Snapshot {} not written: {}", evt.sequence, evt.reason);
                   emit(core::events::operation_failed{
                     .operation = "save", .error = std::make_error_code(std::errc::io_error) });
                 },
                 [this](const core::events::persistence::stopped &) { persistence_stopped_ = true; } },
      completion);
  }

  auto drain_completions() -> void
  {
    while (auto completion = queues_.persistence_done->try_pop()) { note_completion(*completion); }
  }

  /// Waits until the snapshot with this sequence is on disk; false if it never will be.
  auto await_durable(std::uint64_t sequence) -> boost::asio::awaitable<bool>
  {
    while (durable_sequence_ < sequence) {
      if (persistence_stopped_) { co_return false; }
      auto completion = co_await queues_.persistence_done->pop(cancel_slot_);
      if (const auto *failed = std::get_if<core::events::persistence::write_failed>(&completion);
          failed != nullptr and failed->sequence == sequence) {
        note_completion(completion);
        co_return false;
      }
      note_completion(completion);
    }
    co_return true;
  }

  auto shut_down() -> boost::asio::awaitable<void>
  {
    if (stopping_) { co_return; }
    stopping_ = true;
    spdlog::info("[session_coordinator] Shutting down");

    settle_pending_network_events();
    mark_taken_as_sent();

    try {
      if (not co_await await_durable(save())) {
        spdlog::error("[session_coordinator] Final snapshot was not confirmed durable");
      }
      queues_.persistence->close();
      while (not persistence_stopped_) { note_completion(co_await queues_.persistence_done->pop(cancel_slot_)); }
    } catch (const boost::system::system_error &e) {
      if (not core::is_stop_request(e.code())) { throw; }
      spdlog::warn("[session_coordinator] Shutdown interrupted before persistence stopped");
      queues_.persistence->close();
    }

    queues_.network->close();
    queues_.in->close();
    emit(core::events::shutdown_complete{});
  }

  /// Applies deliveries already reported by the network actor and returns unabsorbed records to the server.
  auto settle_pending_network_events() -> void
  {
    while (auto pending = queues_.in->try_pop()) {
      std::visit(core::overload{ [this](const core::events::network::message_sent &evt) {
                                  std::ignore = lifecycle::mark_sent(state_, evt.id, clock_());
                                },
                   [](const core::events::network::new_message &evt) {
                     if (evt.ack) { evt.ack(false); }
                   },
                   [](const auto &) { spdlog::debug("[session_coordinator] Dropping event queued behind shutdown"); } },
        *pending);
    }
  }

  /// An unsent message missing from the queue has been taken by the network actor.
  auto mark_taken_as_sent() -> void
  {
    const auto waiting = state_.queue->snapshot();
    const auto now = clock_();
    for (auto &outbound : state_.outbox) {
      if (outbound.sent != 0) { continue; }
      const auto in_queue = [&outbound](const auto &item) { return item.id == outbound.id; };
      if (not std::ranges::any_of(waiting, in_queue)) {
        spdlog::debug("[session_coordinator] {:016x} left the queue without a report, marking it sent", outbound.id);
        outbound.sent = now;
      }
    }
  }

  auto absorb(const core::events::network::new_message &evt) -> boost::asio::awaitable<void>
  {
    using outcome = lifecycle::absorb_result::outcome;

    auto before = state_;
    const auto result = lifecycle::absorb_fetched(state_, *sealer_, evt.record, clock_());
    if (result.result == outcome::rejected or result.result == outcome::stale) {
      state_ = std::move(before);
      if (evt.ack) { evt.ack(true); }
      co_return;
    }

    if (not co_await await_durable(save())) {
      spdlog::error("[session_coordinator] Fetched record not durable, leaving it on the server");
      state_ = std::move(before);
      if (evt.ack) { evt.ack(false); }
      co_return;
    }

    if (result.acked_outbound) {
      emit(core::events::message_acked{ .id = *result.acked_outbound, .to = state_.contact_name(result.contact_id) });
    }
    if (result.inbound_id) {
      emit(core::events::message_received{ .id = *result.inbound_id,
        .from = state_.contact_name(result.contact_id),
        .sealed = result.result == outcome::held_sealed });
    }
    if (evt.ack) { evt.ack(true); }
  }

  auto named_contact(const std::string &name) -> model::contact &
  {
    auto *peer = state_.find_contact(name);
    if (peer == nullptr) { core::raise(core::errc::unknown_contact, name); }
    return *peer;
  }

  auto queued(const model::outbound_message &outbound, std::string usage) -> void
  {
    save();
    emit(core::events::message_queued{
      .id = outbound.id, .to = state_.contact_name(outbound.to), .usage = std::move(usage) });
    std::ignore = trigger_network();
  }

  auto outbox_summary(const model::outbound_message &outbound) const -> core::events::outbox_entry
  {
    return { .id = outbound.id,
      .to = state_.contact_name(outbound.to),
      .created = outbound.created,
      .status = outbound.status() };
  }

  auto handle(const core::events::create_contact &cmd) -> void
  {
    if (state_.find_contact(cmd.name) != nullptr) { core::raise(core::errc::duplicate_contact_name, cmd.name); }

    model::contact peer{ .id = state_.fresh_contact_id(), .name = cmd.name };
    const auto record = handshake::generate(peer, state_.self);
    state_.contacts.emplace(peer.id, std::move(peer));

    save();
    emit(core::events::contact_created{ .name = cmd.name, .armored_handshake = handshake::armor(record) });
  }

  auto handle(const core::events::apply_handshake &cmd) -> void
  {
    auto &peer = named_contact(cmd.contact);
    const auto record = handshake::dearmor(cmd.armored);
    if (not record) { core::raise(core::errc::no_handshake_found); }

    if (const auto error = handshake::apply(peer, *record, options_)) { throw std::system_error(error, cmd.contact); }

    const auto unsealed = lifecycle::unseal_on_handshake_complete(state_, *sealer_, peer.id, clock_());
    save();
    emit(core::events::handshake_applied{ .name = peer.name, .unsealed = unsealed });
  }

  auto handle(const core::events::compose &cmd) -> void
  {
    const auto contact_id = named_contact(cmd.contact).id;
    const auto &outbound =
      lifecycle::send_message(state_, *sealer_, contact_id, cmd.body, cmd.attachments, clock_());
    queued(outbound, lifecycle::estimate_usage(cmd.body, false, cmd.attachments).to_string());
  }

  auto handle(const core::events::reply &cmd) -> void
  {
    const auto &outbound = lifecycle::reply(state_, *sealer_, cmd.inbound_id, cmd.body, {}, clock_());
    queued(outbound, lifecycle::estimate_usage(cmd.body, true).to_string());
  }

  auto handle(const core::events::ack_inbound &cmd) -> void
  {
    const auto &outbound = lifecycle::ack_inbound(state_, *sealer_, cmd.inbound_id, clock_());
    queued(outbound, {});
  }

  auto handle(const core::events::open_inbound &cmd) -> void
  {
    const auto &inbound = lifecycle::mark_read(state_, cmd.inbound_id);
    const auto *record = inbound.record();

    core::events::inbound_opened opened{ .id = inbound.id,
      .from = state_.contact_name(inbound.from),
      .sent_time = record->time,
      .received_time = inbound.received,
      .body = model::body_text(*record),
      .attachment_names = {},
      .in_reply_to = record->in_reply_to };
    std::ranges::transform(record->attachments, std::back_inserter(opened.attachment_names), [](const auto &file) {
      return file.filename;
    });

    save();
    emit(std::move(opened));
  }

  auto handle(const core::events::show_contact &cmd) -> void
  {
    const auto &peer = named_contact(cmd.name);
    emit(core::events::contact_details{ .name = peer.name,
      .pending = peer.pending,
      .generation = peer.generation,
      .server = peer.their_server,
      .identity_public_hex = peer.pending ? std::string{} : crypto::to_hex(peer.their_identity_public),
      .armored_handshake = peer.pending ? handshake::armor(peer.handshake_bytes) : std::string{} });
  }

  auto handle(const core::events::show_outbound &cmd) -> void
  {
    const auto *outbound = state_.find_outbound(cmd.outbound_id);
    if (outbound == nullptr) { core::raise(core::errc::unknown_message); }
    emit(core::events::outbound_details{ .summary = outbox_summary(*outbound),
      .sent = outbound->sent,
      .acked = outbound->acked,
      .body = model::body_text(outbound->record) });
  }

  auto handle(const core::events::list_contacts & /*cmd*/) -> void
  {
    core::events::contacts_listed listed;
    for (const auto &[id, peer] : state_.contacts) {
      listed.contacts.push_back({ .name = peer.name, .pending = peer.pending });
    }
    std::ranges::sort(listed.contacts, {}, &core::events::contact_summary::name);
    emit(std::move(listed));
  }

  auto handle(const core::events::list_inbox & /*cmd*/) -> void
  {
    core::events::inbox_listed listed;
    for (const auto &inbound : state_.inbox) {
      listed.messages.push_back({ .id = inbound.id,
        .from = state_.contact_name(inbound.from),
        .received_time = inbound.received,
        .sealed = inbound.is_sealed(),
        .read = inbound.read,
        .acked = inbound.acked });
    }
    emit(std::move(listed));
  }

  auto handle(const core::events::list_outbox & /*cmd*/) -> void
  {
    core::events::outbox_listed listed;
    for (const auto &outbound : state_.outbox) { listed.messages.push_back(outbox_summary(outbound)); }
    emit(std::move(listed));
  }

  auto handle(const core::events::show_identity & /*cmd*/) -> void
  {
    emit(core::events::identity_shown{ .server = state_.self.server,
      .identity_public_hex = crypto::to_hex(state_.self.identity_public),
      .generation = state_.self.generation });
  }

  auto handle(const core::events::estimate_usage &cmd) -> void
  {
    const auto usage = lifecycle::estimate_usage(cmd.body, cmd.is_reply, cmd.attachments);
    emit(core::events::usage_estimated{ .usage = usage.to_string(), .over_limit = usage.over_limit });
  }

  auto handle(const core::events::fetch_now & /*cmd*/) -> void
  {
    auto presentation = queues_.presentation;
    const bool accepted = trigger_network([presentation] {
      std::ignore = presentation->try_push(core::events::fetch_completed{});
    });
    if (not accepted) { spdlog::warn("[session_coordinator] Network actor is not accepting triggers"); }
  }

  auto handle(const core::events::network::message_sent &evt) -> void
  {
    if (not lifecycle::mark_sent(state_, evt.id, clock_())) { return; }
    const auto *outbound = state_.find_outbound(evt.id);
    save();
    emit(core::events::message_sent{ .id = evt.id, .to = state_.contact_name(outbound->to) });
  }

  template<typename Event> static constexpr auto operation_name(const Event & /*evt*/) -> std::string_view
  {
    if constexpr (std::is_same_v<Event, core::events::create_contact>) {
      return "new contact";
    } else if constexpr (std::is_same_v<Event, core::events::apply_handshake>) {
      return "key exchange";
    } else if constexpr (std::is_same_v<Event, core::events::compose>) {
      return "send";
    } else if constexpr (std::is_same_v<Event, core::events::reply>) {
      return "reply";
    } else if constexpr (std::is_same_v<Event, core::events::ack_inbound>) {
      return "ack";
    } else if constexpr (std::is_same_v<Event, core::events::open_inbound>) {
      return "open";
    } else if constexpr (std::is_same_v<Event, core::events::show_contact>) {
      return "show contact";
    } else if constexpr (std::is_same_v<Event, core::events::show_outbound>) {
      return "show message";
    } else {
      return "command";
    }
  }
};

}// namespace courier::coordinator
