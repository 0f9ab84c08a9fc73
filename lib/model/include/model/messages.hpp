#pragma once

#include <chrono>
#include <core/events.hpp>
#include <crypto/bytes.hpp>
#include <cstdint>
#include <model/message_record.hpp>
#include <string>
#include <variant>

namespace courier::model {

/// Inbound messages become eligible for deletion this long after receipt
inline constexpr auto message_lifetime = std::chrono::hours(24 * 7);

/// Ciphertext held until the sender's key exchange is applied
struct sealed_payload
{
  crypto::bytes ciphertext;

  friend auto operator==(const sealed_payload &, const sealed_payload &) -> bool = default;
};

struct inbound_message
{
  std::uint64_t id{ 0 };
  bool read{ false };
  std::int64_t received{ 0 };
  std::uint64_t from{ 0 };///< Origin contact id
  bool acked{ false };
  std::variant<sealed_payload, message_record> content;

  [[nodiscard]] auto is_sealed() const -> bool { return std::holds_alternative<sealed_payload>(content); }

  [[nodiscard]] auto record() const -> const message_record * { return std::get_if<message_record>(&content); }

  [[nodiscard]] auto erase_time() const -> std::int64_t
  {
    return received + std::chrono::duration_cast<std::chrono::seconds>(message_lifetime).count();
  }

  friend auto operator==(const inbound_message &, const inbound_message &) -> bool = default;
};

/**
 * @brief A message we composed. Status is derived from the timestamps, zero meaning unset.
 */
struct outbound_message
{
  std::uint64_t id{ 0 };
  std::uint64_t to{ 0 };///< Destination contact id
  std::string server;///< Destination server address
  std::int64_t created{ 0 };
  std::int64_t sent{ 0 };
  std::int64_t acked{ 0 };
  message_record record;
  crypto::bytes sealed;///< Transmission payload produced at enqueue time

  [[nodiscard]] auto status() const -> core::events::outbound_status
  {
    if (acked != 0) { return core::events::outbound_status::acked; }
    if (sent != 0) { return core::events::outbound_status::sent; }
    return core::events::outbound_status::queued;
  }

  friend auto operator==(const outbound_message &, const outbound_message &) -> bool = default;
};

}// namespace courier::model
