#pragma once

#include <crypto/bytes.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace courier::crypto {

[[nodiscard]] auto base64_encode(std::span<const std::uint8_t> data) -> std::string;

/// Decodes standard base64, ignoring whitespace.
[[nodiscard]] auto base64_decode(std::string_view text) -> std::optional<bytes>;

/// RFC 4648 base32 without padding.
[[nodiscard]] auto base32_encode(std::span<const std::uint8_t> data) -> std::string;

/// Decodes RFC 4648 base32, case-insensitive, padding optional.
[[nodiscard]] auto base32_decode(std::string_view text) -> std::optional<bytes>;

/**
 * @brief Wraps data in a PEM-style text block.
 *
 * @param label Block label, e.g. "COURIER KEY EXCHANGE"
 */
[[nodiscard]] auto armor(std::string_view label, std::span<const std::uint8_t> data) -> std::string;

/**
 * @brief Extracts the first block with the given label from arbitrary text.
 *
 * @return std::nullopt if no block with that label is present or its body is not base64
 */
[[nodiscard]] auto dearmor(std::string_view label, std::string_view text) -> std::optional<bytes>;

}// namespace courier::crypto
