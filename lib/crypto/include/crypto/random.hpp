#pragma once

#include <crypto/bytes.hpp>
#include <span>

namespace courier::crypto {

/// Fills the buffer from the system CSPRNG.
auto fill_random(std::span<std::uint8_t> out) -> void;

[[nodiscard]] auto random_key() -> key32;

[[nodiscard]] auto random_bytes(std::size_t count) -> bytes;

}// namespace courier::crypto
