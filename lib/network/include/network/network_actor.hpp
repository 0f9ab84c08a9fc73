#pragma once

#include <async/async_queue.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <concepts/message_transport.hpp>
#include <core/events.hpp>
#include <core/processor_runner.hpp>
#include <memory>
#include <model/message_queue.hpp>
#include <spdlog/spdlog.h>
#include <tuple>
#include <variant>

namespace courier::network {

/**
 * @brief Network actor: drains the message queue and fetches inbound records.
 *
 * A transaction first delivers queued transmissions in order, stopping at the first
 * the server refuses, then fetches records one at a time. Each fetched record is
 * handed to the session owner with an ack callback; the record is released from the
 * transport only after that callback reports it absorbed, so nothing fetched is lost
 * before it is durable. A record the session could not store ends the transaction and
 * stays on the server for the next one.
 *
 * @tparam Transport Type satisfying concepts::message_transport
 */
template<concepts::message_transport Transport> class network_actor
{
public:
  using in_queue_t = async::async_queue<core::events::network::in_t>;
  using session_queue_t = async::async_queue<core::events::session_coordinator::in_t>;

  network_actor(std::shared_ptr<Transport> transport,// NOLINT(modernize-pass-by-value)
    std::shared_ptr<boost::asio::io_context> io_context,// NOLINT(modernize-pass-by-value)
    std::shared_ptr<in_queue_t> in_queue,// NOLINT(modernize-pass-by-value)
    std::shared_ptr<model::message_queue> outgoing,// NOLINT(modernize-pass-by-value)
    std::shared_ptr<session_queue_t> to_session_queue,// NOLINT(modernize-pass-by-value)
    std::chrono::milliseconds fetch_interval = std::chrono::milliseconds::zero())
    : transport_(std::move(transport)), io_context_(std::move(io_context)), in_queue_(std::move(in_queue)),
      outgoing_(std::move(outgoing)), to_session_queue_(std::move(to_session_queue)), fetch_interval_(fetch_interval)
  {}

  network_actor(const network_actor &) = delete;
  auto operator=(const network_actor &) -> network_actor & = delete;
  network_actor(network_actor &&) = delete;
  auto operator=(network_actor &&) -> network_actor & = delete;
  ~network_actor() = default;

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run_once(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    auto evt = co_await in_queue_->pop(cancel_slot);
    co_await std::visit([&](auto &&event) { return handle(event, cancel_slot); }, evt);
  }

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    if (fetch_interval_ > std::chrono::milliseconds::zero()) {
      boost::asio::co_spawn(*io_context_, tick(), boost::asio::detached);
    }

    try {
      while (true) { co_await run_once(cancel_slot); }
    } catch (const boost::system::system_error &e) {
      if (not core::is_stop_request(e.code())) {
        spdlog::error("[network] Unexpected error in run loop: {}", e.what());
        timer_cancel_.emit(boost::asio::cancellation_type::all);
        throw;
      }
      spdlog::debug("[network] Cancelled, exiting run loop");
    }
    timer_cancel_.emit(boost::asio::cancellation_type::all);
  }

  /**
   * @brief Delivers queued transmissions, then fetches until the transport has nothing more.
   */
  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto transact(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    send_queued();
    co_await fetch_all(cancel_slot);
  }

private:
  std::shared_ptr<Transport> transport_;
  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<in_queue_t> in_queue_;
  std::shared_ptr<model::message_queue> outgoing_;
  std::shared_ptr<session_queue_t> to_session_queue_;
  std::chrono::milliseconds fetch_interval_;
  boost::asio::cancellation_signal timer_cancel_;

  auto emit(core::events::session_coordinator::in_t evt) -> bool
  {
    if (to_session_queue_->try_push(std::move(evt))) { return true; }
    spdlog::debug("[network] Session queue closed, dropping event");
    return false;
  }

  auto handle(const core::events::network::trigger &evt, std::shared_ptr<boost::asio::cancellation_slot> cancel_slot)
    -> boost::asio::awaitable<void>
  {
    co_await transact(std::move(cancel_slot));
    if (evt.on_complete) { evt.on_complete(); }
  }

  auto send_queued() -> void
  {
    while (auto next = outgoing_->front()) {
      if (not transport_->deliver(*next)) {
        spdlog::warn("[network] Delivery of {:016x} refused, leaving it queued", next->id);
        return;
      }
      std::ignore = outgoing_->remove(next->id);
      spdlog::debug("[network] Delivered {:016x} to {}", next->id, next->server);
      if (not emit(core::events::network::message_sent{ .id = next->id })) { return; }
    }
  }

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto fetch_all(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) -> boost::asio::awaitable<void>
  {
    while (auto record = transport_->fetch()) {
      const auto handle = record->handle;
      auto absorbed = std::make_shared<async::async_queue<bool>>(io_context_);

      core::events::network::new_message evt{ .record = std::move(*record),
        .ack = [absorbed](bool durable) { std::ignore = absorbed->try_push(durable); } };
      if (not emit(std::move(evt))) { co_return; }

      if (not co_await absorbed->pop(cancel_slot)) {
        spdlog::warn("[network] Session could not store {}, leaving it on the server", handle);
        co_return;
      }
      transport_->release(handle);
      spdlog::trace("[network] Released {}", handle);
    }
  }

  auto tick() -> boost::asio::awaitable<void>
  {
    boost::asio::steady_timer timer(*io_context_);
    while (true) {
      timer.expires_after(fetch_interval_);
      boost::system::error_code error_code;
      co_await timer.async_wait(boost::asio::bind_cancellation_slot(
        timer_cancel_.slot(), boost::asio::redirect_error(boost::asio::use_awaitable, error_code)));
      if (error_code) { co_return; }
      if (not in_queue_->try_push(core::events::network::trigger{})) { co_return; }
    }
  }
};

}// namespace courier::network
