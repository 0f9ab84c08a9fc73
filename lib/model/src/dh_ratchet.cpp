#include <model/dh_ratchet.hpp>

#include <crypto/x25519.hpp>

namespace courier::model {

auto dh_ratchet::seed_local() -> crypto::key32
{
  const auto scalar = crypto::x25519::generate_private();
  local.previous = scalar;
  return crypto::x25519::public_from_private(scalar);
}

auto dh_ratchet::seed_remote(const crypto::key32 &peer_public) -> void
{
  remote.previous = peer_public;
  remote.current = peer_public;
}

auto dh_ratchet::next_local_public() -> crypto::key32
{
  if (not local.current or current_confirmed) {
    local.advance(crypto::x25519::generate_private());
    current_confirmed = false;
  }
  return crypto::x25519::public_from_private(*local.current);
}

auto dh_ratchet::observe_remote(const crypto::key32 &peer_next) -> bool
{
  if (not crypto::x25519::is_usable_public(peer_next) or remote.current == peer_next) { return false; }
  remote.advance(peer_next);
  return true;
}

auto dh_ratchet::sending_private() const -> std::optional<crypto::key32>
{
  if (local.current) { return local.current; }
  return local.previous;
}

auto dh_ratchet::sending_remote() const -> std::optional<crypto::key32> { return remote.current; }

}// namespace courier::model
