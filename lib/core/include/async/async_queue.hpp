#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <memory>
#include <optional>

namespace courier::async {

/**
 * @brief Thread-safe asynchronous channel between actors.
 *
 * @tparam T The type of elements carried by the channel
 *
 * Any thread may push. A single coroutine consumer pops. Closing the channel wakes
 * a pending consumer with channel_closed, which actor run loops treat as a stop request.
 */
template<typename T> class async_queue
{
public:
  /// Maximum number of undelivered elements
  static const std::size_t channel_size{ 1024 };

  explicit async_queue(const std::shared_ptr<boost::asio::io_context> &io_context)
    : io_context_(io_context), channel_(*io_context_, channel_size), size_(0)
  {}

  async_queue(const async_queue &) = delete;
  auto operator=(const async_queue &) -> async_queue & = delete;
  async_queue(async_queue &&) = delete;
  auto operator=(async_queue &&) -> async_queue & = delete;
  ~async_queue() = default;

  /**
   * @brief Pushes a value onto the channel.
   *
   * @param value The value to push
   * @throws boost::system::system_error with channel_closed if the channel is closed or full
   */
  auto push(T value) -> void
  {
    if (not try_push(std::move(value))) {
      throw boost::system::system_error(boost::asio::experimental::error::channel_closed);
    }
  }

  /**
   * @brief Pushes a value if the channel still accepts it.
   *
   * @param value The value to push
   * @return false if the channel is closed or full
   */
  [[nodiscard]] auto try_push(T value) -> bool
  {
    if (not channel_.try_send(boost::system::error_code{}, std::move(value))) { return false; }
    ++size_;
    return true;
  }

  /**
   * @brief Asynchronously pops the next value.
   *
   * @param cancel_slot Optional cancellation slot
   * @return Awaitable yielding the next value
   * @throws boost::system::system_error on cancellation or when the channel is closed
   */
  auto pop(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<T>
  {
    boost::system::error_code err;

    if (cancel_slot) {
      auto val = co_await channel_.async_receive(boost::asio::bind_cancellation_slot(
        *cancel_slot, boost::asio::redirect_error(boost::asio::use_awaitable, err)));
      if (err) { throw boost::system::system_error(err); }
      --size_;
      co_return val;
    } else {
      auto val = co_await channel_.async_receive(boost::asio::redirect_error(boost::asio::use_awaitable, err));
      if (err) { throw boost::system::system_error(err); }
      --size_;
      co_return val;
    }
  }

  /**
   * @brief Pops a value without waiting.
   *
   * @return The value if one was available
   */
  auto try_pop() -> std::optional<T>
  {
    std::optional<T> value;
    const bool received = channel_.try_receive([&value](boost::system::error_code err, T rx_value) {
      if (not err) { value = std::move(rx_value); }
    });

    if (received and value) {
      --size_;
      return value;
    }
    return std::nullopt;
  }

  [[nodiscard]] auto empty() const -> bool { return size_.load() == 0; }

  [[nodiscard]] auto size() const -> std::size_t { return size_.load(); }

  [[nodiscard]] auto is_open() const -> bool { return channel_.is_open(); }

  /**
   * @brief Closes the channel. Pending and future pops fail with channel_closed.
   */
  auto close() -> void { channel_.close(); }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
  std::atomic<std::size_t> size_;
};

}// namespace courier::async
