#pragma once

#include <core/events.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace courier::model {

/**
 * @brief Transmissions awaiting the network actor, in priority order.
 *
 * The session owner appends; the network actor reads the front and removes
 * entries once the server has accepted them. Every operation takes the lock.
 */
class message_queue
{
public:
  using delivery = core::events::delivery;

  message_queue() = default;
  message_queue(const message_queue &) = delete;
  auto operator=(const message_queue &) -> message_queue & = delete;
  message_queue(message_queue &&) = delete;
  auto operator=(message_queue &&) -> message_queue & = delete;
  ~message_queue() = default;

  auto enqueue(delivery item) -> void;

  [[nodiscard]] auto front() const -> std::optional<delivery>;

  /// Removes the entry with this id; returns false if absent.
  auto remove(std::uint64_t id) -> bool;

  [[nodiscard]] auto snapshot() const -> std::vector<delivery>;

  [[nodiscard]] auto size() const -> std::size_t;

  [[nodiscard]] auto empty() const -> bool { return size() == 0; }

private:
  mutable std::mutex mutex_;
  std::deque<delivery> items_;
};

}// namespace courier::model
