#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/system_error.hpp>
#include <concepts>
#include <core/errors.hpp>
#include <memory>
#include <spdlog/spdlog.h>
#include <string_view>

namespace courier::core {

/**
 * @brief Concept for actors that can be spawned on an io_context.
 */
template<typename T>
concept Processor = requires(T proc, std::shared_ptr<boost::asio::cancellation_slot> slot) {
  { proc.run(slot) } -> std::same_as<boost::asio::awaitable<void>>;
};

/// True for the error codes an actor sees when asked to stop.
[[nodiscard]] inline auto is_stop_request(const boost::system::error_code &code) -> bool
{
  return code == boost::asio::error::operation_aborted or code == boost::asio::experimental::error::channel_cancelled
         or code == boost::asio::experimental::error::channel_closed;
}

/**
 * @brief Runs an actor to completion, logging how it ended.
 *
 * @tparam P Processor type
 * @param proc The actor
 * @param cancel_slot Cancellation slot for stopping the actor
 * @param processor_name Name used in log lines
 */
template<Processor P>
auto run_processor(std::shared_ptr<P> proc,
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot,
  std::string_view processor_name) -> boost::asio::awaitable<void>
{
  spdlog::trace("[{}] Coroutine started", processor_name);
  try {
    co_await proc->run(cancel_slot);
  } catch (const boost::system::system_error &err) {
    if (is_stop_request(err.code())) {
      spdlog::debug("[{}] Stopped", processor_name);
      co_return;
    }
    spdlog::error("[{}] Unexpected error: {}", processor_name, err.what());
  } catch (const defect_error &err) {
    spdlog::critical("[{}] Internal error, actor halted: {}", processor_name, err.what());
  } catch (const std::exception &err) {
    spdlog::error("[{}] Unknown exception: {}", processor_name, err.what());
  }
  spdlog::trace("[{}] Coroutine exiting", processor_name);
}

/**
 * @brief Tracks the lifecycle state of a spawned actor.
 */
struct coroutine_state
{
  std::atomic<bool> started{ false };///< Set when the actor begins executing
  std::atomic<bool> done{ false };///< Set when the actor has returned

  [[nodiscard]] auto finished() const -> bool { return started.load() == done.load(); }
};

/**
 * @brief Spawns an actor as a detached coroutine.
 *
 * @return State that the caller polls during shutdown
 */
template<Processor P>
auto spawn_processor(const std::shared_ptr<boost::asio::io_context> &io_ctx,
  std::shared_ptr<P> proc,
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot,
  std::string_view processor_name) -> std::shared_ptr<coroutine_state>
{
  auto state = std::make_shared<coroutine_state>();
  boost::asio::co_spawn(
    *io_ctx,
    [](std::shared_ptr<P> processor,
      std::shared_ptr<boost::asio::cancellation_slot> c_slot,
      std::string_view name,
      std::shared_ptr<coroutine_state> coro_state) -> boost::asio::awaitable<void> {
      coro_state->started = true;
      co_await run_processor(processor, c_slot, name);
      coro_state->done = true;
    }(proc, cancel_slot, processor_name, state),
    boost::asio::detached);
  return state;
}

}// namespace courier::core
