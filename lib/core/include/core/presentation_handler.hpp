#pragma once

#include <async/async_queue.hpp>
#include <core/events.hpp>
#include <fmt/core.h>
#include <memory>
#include <platform/time_utils.hpp>
#include <spdlog/spdlog.h>
#include <string_view>
#include <utility>
#include <variant>

namespace courier::core {

/**
 * @brief Handles presentation events and generates user-facing messages.
 *
 * Converts coordinator output (contacts created, messages queued, delivered,
 * received, listings, failures) into formatted display lines. Message ids are shown
 * as 16 hex digits, the form the command parser accepts.
 */
struct presentation_handler
{
  // Type traits for standard_processor
  using in_queue_t = async::async_queue<events::presentation_event_variant_t>;

  struct out_queues_t
  {
    std::shared_ptr<async::async_queue<events::display_message>> display;
  };

  explicit presentation_handler(const out_queues_t &queues) : display_out_queue_(queues.display) {}

  /**
   * @brief Variant handler for standard_processor.
   */
  auto handle(const events::presentation_event_variant_t &event) const -> void
  {
    std::visit([this](const auto &evt) { this->handle(evt); }, event);
  }

  auto handle(const events::contact_created &evt) const -> void
  {
    emit("Created contact {}. Send them this key exchange, then /accept theirs:\n{}", evt.name, evt.armored_handshake);
  }

  auto handle(const events::handshake_applied &evt) const -> void
  {
    if (evt.unsealed == 0) {
      emit("Key exchange with {} complete\n", evt.name);
    } else {
      emit("Key exchange with {} complete, {} held message(s) decoded\n", evt.name, evt.unsealed);
    }
  }

  auto handle(const events::message_queued &evt) const -> void
  {
    if (evt.usage.empty()) {
      emit("[{:016x}] Queued to {}\n", evt.id, evt.to);
    } else {
      emit("[{:016x}] Queued to {} ({})\n", evt.id, evt.to, evt.usage);
    }
  }

  auto handle(const events::message_sent &evt) const -> void { emit("[{:016x}] Sent to {}\n", evt.id, evt.to); }

  auto handle(const events::message_acked &evt) const -> void
  {
    emit("[{:016x}] Acknowledged by {}\n", evt.id, evt.to);
  }

  auto handle(const events::message_received &evt) const -> void
  {
    if (evt.sealed) {
      emit("[{:016x}] Message from {} held until their key exchange is applied\n", evt.id, evt.from);
    } else {
      emit("[{:016x}] New message from {}\n", evt.id, evt.from);
    }
  }

  /**
   * @brief Shows a decoded inbound message with its header lines.
   */
  auto handle(const events::inbound_opened &evt) const -> void
  {
    emit("From:     {}\nSent:     {}\nReceived: {}\n",
      evt.from,
      platform::format_timestamp(evt.sent_time),
      platform::format_timestamp(evt.received_time));
    if (evt.in_reply_to) { emit("Reply to: {:016x}\n", *evt.in_reply_to); }
    for (const auto &name : evt.attachment_names) { emit("Attached: {}\n", name); }
    emit("\n{}\n", evt.body);
  }

  auto handle(const events::contacts_listed &evt) const -> void
  {
    if (evt.contacts.empty()) {
      emit("No contacts\n");
      return;
    }
    for (const auto &entry : evt.contacts) { emit("  {}{}\n", entry.name, entry.pending ? " (pending)" : ""); }
  }

  auto handle(const events::inbox_listed &evt) const -> void
  {
    if (evt.messages.empty()) {
      emit("Inbox is empty\n");
      return;
    }
    for (const auto &entry : evt.messages) {
      emit("  {} [{:016x}] {} {}\n",
        inbox_indicator(entry),
        entry.id,
        platform::format_timestamp(entry.received_time),
        entry.from);
    }
  }

  auto handle(const events::outbox_listed &evt) const -> void
  {
    if (evt.messages.empty()) {
      emit("Outbox is empty\n");
      return;
    }
    for (const auto &entry : evt.messages) {
      emit("  {:<6} [{:016x}] {} {}\n",
        status_name(entry.status),
        entry.id,
        platform::format_timestamp(entry.created),
        entry.to);
    }
  }

  auto handle(const events::contact_details &evt) const -> void
  {
    if (evt.pending) {
      emit("{} (pending)\nYour key exchange for {}:\n{}", evt.name, evt.name, evt.armored_handshake);
      return;
    }
    emit("{}\n  Server:     {}\n  Identity:   {}\n  Generation: {}\n",
      evt.name,
      evt.server,
      evt.identity_public_hex,
      evt.generation);
  }

  auto handle(const events::outbound_details &evt) const -> void
  {
    emit("To:      {}\nStatus:  {}\nCreated: {}\nSent:    {}\nAcked:   {}\n\n{}\n",
      evt.summary.to,
      status_name(evt.summary.status),
      platform::format_timestamp(evt.summary.created),
      platform::format_timestamp(evt.sent),
      platform::format_timestamp(evt.acked),
      evt.body);
  }

  auto handle(const events::identity_shown &evt) const -> void
  {
    emit("Server:     {}\nIdentity:   {}\nGeneration: {}\n", evt.server, evt.identity_public_hex, evt.generation);
  }

  auto handle(const events::usage_estimated &evt) const -> void
  {
    emit("{}{}\n", evt.usage, evt.over_limit ? " (too large)" : "");
  }

  auto handle(const events::fetch_completed & /*evt*/) const -> void { emit("Fetch complete\n"); }

  auto handle(const events::operation_failed &evt) const -> void
  {
    emit("{} failed: {}\n", evt.operation, evt.error.message());
  }

  static auto handle(const events::shutdown_complete & /*evt*/) -> void
  {
    spdlog::debug("[presentation] Session shut down");
  }

  [[nodiscard]] static constexpr auto status_name(events::outbound_status status) -> std::string_view
  {
    switch (status) {
    case events::outbound_status::queued:
      return "queued";
    case events::outbound_status::sent:
      return "sent";
    case events::outbound_status::acked:
      return "acked";
    }
    return "?";
  }

  /// One-character inbox marker: sealed, unread, read, acknowledged.
  [[nodiscard]] static constexpr auto inbox_indicator(const events::inbox_entry &entry) -> char
  {
    if (entry.sealed) { return '#'; }
    if (not entry.read) { return '*'; }
    if (entry.acked) { return '+'; }
    return ' ';
  }

private:
  std::shared_ptr<async::async_queue<events::display_message>> display_out_queue_;

  template<typename... Args> auto emit(fmt::format_string<Args...> format_string, Args &&...args) const -> void
  {
    display_out_queue_->push(events::display_message{ fmt::format(format_string, std::forward<Args>(args)...) });
  }
};

}// namespace courier::core
