#pragma once

#include <algorithm>
#include <concepts/message_transport.hpp>
#include <core/events.hpp>
#include <deque>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace courier_test {

/**
 * In-memory delivery server. Records queued for fetch stay available until released.
 */
struct test_double_transport
{
  std::vector<courier::core::events::delivery> delivered;
  std::deque<courier::core::events::fetched_record> inbox;
  std::vector<std::string> released;
  std::size_t accept_limit = std::numeric_limits<std::size_t>::max();///< Deliveries accepted before refusing
  std::size_t fetch_calls = 0;

  auto deliver(const courier::core::events::delivery &item) -> bool
  {
    if (delivered.size() >= accept_limit) { return false; }
    delivered.push_back(item);
    return true;
  }

  auto fetch() -> std::optional<courier::core::events::fetched_record>
  {
    ++fetch_calls;
    for (const auto &record : inbox) {
      if (std::ranges::find(released, record.handle) == released.end()) { return record; }
    }
    return std::nullopt;
  }

  auto release(const std::string &handle) -> void { released.push_back(handle); }

  auto add_record(std::vector<std::uint8_t> payload, std::vector<std::uint8_t> credential = {}) -> void
  {
    inbox.push_back(courier::core::events::fetched_record{ .credential = std::move(credential),
      .generation = 0,
      .payload = std::move(payload),
      .handle = "record-" + std::to_string(inbox.size() + 1) });
  }
};

static_assert(courier::concepts::message_transport<test_double_transport>);

}// namespace courier_test
