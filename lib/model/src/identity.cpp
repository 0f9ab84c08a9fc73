#include <model/identity.hpp>

#include <crypto/x25519.hpp>

namespace courier::model {

auto identity::create(std::string server) -> identity
{
  identity self;
  self.signing = crypto::ed25519::generate();
  self.identity_private = crypto::x25519::generate_private();
  self.identity_public = crypto::x25519::public_from_private(self.identity_private);
  self.group_private = crypto::ed25519::generate().private_key;
  self.server = std::move(server);
  return self;
}

}// namespace courier::model
