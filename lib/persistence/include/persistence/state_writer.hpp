#pragma once

#include <async/async_queue.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>
#include <core/events.hpp>
#include <crypto/bytes.hpp>
#include <filesystem>
#include <memory>

namespace courier::persistence {

/**
 * @brief Persistence actor: encrypts snapshots and writes them to the state file.
 *
 * Each save is acknowledged with written (or write_failed) on the output queue.
 * Closing the input queue makes the actor finish outstanding saves, report
 * stopped and exit.
 */
class state_writer
{
public:
  using in_queue_t = async::async_queue<core::events::persistence::in_t>;
  using out_queue_t = async::async_queue<core::events::persistence::out_t>;

  state_writer(std::shared_ptr<in_queue_t> in_queue,
    std::shared_ptr<out_queue_t> out_queue,
    std::filesystem::path path,
    const crypto::key32 &key,
    crypto::bytes salt);

  state_writer(const state_writer &) = delete;
  auto operator=(const state_writer &) -> state_writer & = delete;
  state_writer(state_writer &&) = delete;
  auto operator=(state_writer &&) -> state_writer & = delete;
  ~state_writer() = default;

  /**
   * @brief Handles one save request.
   */
  auto run_once(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>;

  /**
   * @brief Handles save requests until the input queue is closed.
   */
  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>;

private:
  auto handle(const core::events::persistence::save &request) -> void;
  auto emit(core::events::persistence::out_t event) -> void;

  std::shared_ptr<in_queue_t> in_queue_;
  std::shared_ptr<out_queue_t> out_queue_;
  std::filesystem::path path_;
  crypto::key32 key_;
  crypto::bytes salt_;
};

}// namespace courier::persistence
