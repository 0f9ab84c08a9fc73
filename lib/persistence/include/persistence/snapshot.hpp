#pragma once

#include <crypto/bytes.hpp>
#include <cstdint>
#include <model/session_state.hpp>
#include <span>

namespace courier::persistence {

inline constexpr std::uint32_t snapshot_version = 1;

/**
 * @brief Serializes the whole session to CBOR.
 */
[[nodiscard]] auto serialize(const model::session_state &state) -> crypto::bytes;

/**
 * @brief Rebuilds a session, including the transmission queue of unsent messages.
 *
 * @throws std::system_error corrupt_state if the snapshot does not parse or is inconsistent
 */
[[nodiscard]] auto deserialize(std::span<const std::uint8_t> data) -> model::session_state;

}// namespace courier::persistence
