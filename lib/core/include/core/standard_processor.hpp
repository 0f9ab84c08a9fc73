#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/system_error.hpp>
#include <core/processor_runner.hpp>
#include <memory>
#include <spdlog/spdlog.h>
#include <utility>

namespace courier::core {

/**
 * @brief Queue-draining loop around a stateless handler.
 *
 * @tparam Handler Handler type that provides in_queue_t and out_queues_t type traits
 *
 * The handler declares what it reads (in_queue_t) and the queues it writes to
 * (out_queues_t). The processor pops one event at a time and hands it to
 * Handler::handle until the input queue is closed or the operation is cancelled.
 */
template<typename Handler> class standard_processor
{
public:
  using in_queue_t = typename Handler::in_queue_t;
  using out_queues_t = typename Handler::out_queues_t;

  /**
   * @brief Constructs the processor and its handler.
   *
   * @param io_context io_context the loop runs on
   * @param in_queue Input queue
   * @param out_queues Output queues, passed to the handler after handler_args
   * @param handler_args Extra handler constructor arguments
   */
  template<typename... HandlerArgs>
  standard_processor(const std::shared_ptr<boost::asio::io_context> &io_context,
    const std::shared_ptr<in_queue_t> &in_queue,
    const out_queues_t &out_queues,
    HandlerArgs &&...handler_args)
    : io_context_(io_context), in_queue_(in_queue),
      handler_(std::make_shared<Handler>(std::forward<HandlerArgs>(handler_args)..., out_queues))
  {}

  /**
   * @brief Handles exactly one event.
   */
  auto run_once(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    auto evt = co_await in_queue_->pop(cancel_slot);
    handler_->handle(evt);
    co_return;
  }

  /**
   * @brief Handles events until the input queue closes or the slot is cancelled.
   */
  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    try {
      while (true) { co_await run_once(cancel_slot); }
    } catch (const boost::system::system_error &e) {
      if (is_stop_request(e.code())) {
        spdlog::debug("[standard_processor] Cancelled, exiting run loop");
        co_return;
      }
      spdlog::error("[standard_processor] Unexpected error in run loop: {}", e.what());
      throw;
    }
  }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<in_queue_t> in_queue_;
  std::shared_ptr<Handler> handler_;
};

}// namespace courier::core
