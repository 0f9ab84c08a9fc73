#pragma once

#include <crypto/bytes.hpp>
#include <crypto/group.hpp>
#include <cstdint>
#include <model/dh_ratchet.hpp>
#include <optional>
#include <string>

namespace courier::model {

/**
 * @brief A correspondent, pending until the peer's key exchange has been applied.
 *
 * While pending only the fields produced by our own key exchange are meaningful.
 * Once active, the peer's verified identity fields never change again; only the
 * ratchet and generation move.
 */
struct contact
{
  std::uint64_t id{ 0 };
  std::string name;
  bool pending{ true };
  crypto::bytes handshake_bytes;///< Our key exchange for this contact, kept while pending

  std::optional<crypto::group::member_credential> issued_credential;///< Given to the peer in our key exchange
  crypto::bytes received_credential;///< Issued to us by the peer
  crypto::key32 their_group{};///< Peer's group descriptor
  std::uint32_t generation{ 0 };///< Peer's group generation
  std::string their_server;
  crypto::key32 their_public_key{};///< Verified long-term signing key
  crypto::key32 their_identity_public{};

  dh_ratchet ratchet;

  friend auto operator==(const contact &, const contact &) -> bool = default;
};

}// namespace courier::model
