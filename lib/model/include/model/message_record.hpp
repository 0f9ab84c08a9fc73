#pragma once

#include <core/events.hpp>
#include <crypto/bytes.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace courier::model {

/// Upper bound on the serialized size of any message record
inline constexpr std::size_t max_serialized_message = 16384;

enum class body_encoding : std::uint8_t { raw = 0 };

using attachment = core::events::attachment;

/**
 * @brief Decoded message as exchanged between contacts.
 *
 * A record with an empty body is an acknowledgement carrier.
 */
struct message_record
{
  std::uint64_t id{ 0 };
  std::int64_t time{ 0 };///< Seconds since the epoch, sender's clock
  crypto::bytes body;
  body_encoding encoding{ body_encoding::raw };
  std::optional<std::uint64_t> in_reply_to;
  crypto::key32 my_next_dh{};///< Sender's next DH public value
  std::vector<attachment> attachments;

  friend auto operator==(const message_record &, const message_record &) -> bool = default;
};

/**
 * @brief Serializes to CBOR.
 *
 * Integer fields use fixed-width encodings so the size depends only on the body,
 * the attachments and whether in_reply_to is present.
 */
[[nodiscard]] auto encode(const message_record &record) -> crypto::bytes;

/// Parses a record, returning std::nullopt on any structural error.
[[nodiscard]] auto decode(std::span<const std::uint8_t> data) -> std::optional<message_record>;

[[nodiscard]] auto serialized_size(const message_record &record) -> std::size_t;

[[nodiscard]] auto body_text(const message_record &record) -> std::string;

}// namespace courier::model
