#pragma once

#include <concepts>
#include <core/events.hpp>
#include <optional>
#include <string>

namespace courier::concepts {

/**
 * @brief Concept defining the interface the network actor uses to reach a delivery server.
 *
 * deliver() hands one queued transmission to the server and reports whether it was
 * accepted. fetch() returns the next record addressed to us, if any; the same record
 * is not returned again once release() has been called with its handle.
 */
template<typename T>
concept message_transport = requires(T &transport,
  const core::events::delivery &item,
  const std::string &handle) {
  { transport.deliver(item) } -> std::same_as<bool>;
  { transport.fetch() } -> std::same_as<std::optional<core::events::fetched_record>>;
  { transport.release(handle) } -> std::same_as<void>;
};

}// namespace courier::concepts
