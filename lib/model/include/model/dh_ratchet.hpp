#pragma once

#include <crypto/bytes.hpp>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace courier::model {

/**
 * @brief Two-slot ring holding the previous and current generation of a value.
 */
template<typename T> struct generation_pair
{
  std::optional<T> previous;
  std::optional<T> current;

  /// Moves current into previous (when set) and installs next as current.
  auto advance(T next) -> void
  {
    if (current) { previous = std::move(current); }
    current = std::move(next);
  }

  friend auto operator==(const generation_pair &, const generation_pair &) -> bool = default;
};

/**
 * @brief Pairwise Diffie-Hellman ratchet state for one contact.
 *
 * Local slots hold our private scalars, remote slots the peer's public values.
 * The key exchange seeds local.previous; composing rotates local.current once the
 * peer has proven it received the current public value by sealing to it.
 */
struct dh_ratchet
{
  generation_pair<crypto::key32> local;
  generation_pair<crypto::key32> remote;
  bool current_confirmed{ false };///< Peer has sealed a message to local.current

  /**
   * @brief Draws the scalar advertised in the key exchange.
   *
   * @return Public value of the new scalar
   */
  auto seed_local() -> crypto::key32;

  /// Installs the peer's key exchange DH value in both remote slots.
  auto seed_remote(const crypto::key32 &peer_public) -> void;

  /**
   * @brief Public value to embed in the next outgoing record.
   *
   * Draws a fresh local.current when none exists or when the peer has confirmed it;
   * otherwise repeats the current value.
   */
  auto next_local_public() -> crypto::key32;

  /**
   * @brief Records the peer's advertised next DH value.
   *
   * @return true if the remote ring advanced
   */
  auto observe_remote(const crypto::key32 &peer_next) -> bool;

  /// Private scalar used to seal outgoing records.
  [[nodiscard]] auto sending_private() const -> std::optional<crypto::key32>;

  /// Peer public value outgoing records are sealed to.
  [[nodiscard]] auto sending_remote() const -> std::optional<crypto::key32>;

  friend auto operator==(const dh_ratchet &, const dh_ratchet &) -> bool = default;
};

}// namespace courier::model
