#include <lifecycle/ratchet_sealer.hpp>

#include <core/errors.hpp>
#include <crypto/aead.hpp>
#include <crypto/kdf.hpp>
#include <crypto/x25519.hpp>
#include <spdlog/spdlog.h>
#include <string_view>
#include <tuple>

namespace courier::lifecycle {

namespace {

  constexpr std::string_view message_key_info{ "courier-message-key" };

  auto message_key(const crypto::key32 &shared,
    const crypto::key32 &sender_public,
    const crypto::key32 &recipient_public) -> crypto::key32
  {
    crypto::bytes salt(sender_public.begin(), sender_public.end());
    salt.insert(salt.end(), recipient_public.begin(), recipient_public.end());
    return crypto::kdf::hkdf_sha256(shared, salt, message_key_info);
  }

}// namespace

auto ratchet_sealer::seal(const model::contact &peer, const model::message_record &record) const -> crypto::bytes
{
  const auto scalar = peer.ratchet.sending_private();
  const auto recipient = peer.ratchet.sending_remote();
  if (not scalar or not recipient) { throw core::defect_error("seal: contact has no ratchet state"); }

  const auto shared = crypto::x25519::shared_secret(*scalar, *recipient);
  if (not shared) { throw core::defect_error("seal: DH with contact's public value failed"); }

  const auto sender_public = crypto::x25519::public_from_private(*scalar);
  const auto key = message_key(*shared, sender_public, *recipient);

  crypto::bytes out(sender_public.begin(), sender_public.end());
  const auto body = crypto::aead::seal(key, model::encode(record));
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

auto ratchet_sealer::unseal(model::contact &peer, std::span<const std::uint8_t> sealed) const
  -> std::optional<model::message_record>
{
  if (sealed.size() < crypto::key_size + crypto::aead::overhead) { return std::nullopt; }

  crypto::key32 sender_public{};
  std::ignore = crypto::copy_key(sealed.first(crypto::key_size), sender_public);
  const auto ciphertext = sealed.subspan(crypto::key_size);

  const auto attempt = [&](const crypto::key32 &scalar) -> std::optional<crypto::bytes> {
    const auto shared = crypto::x25519::shared_secret(scalar, sender_public);
    if (not shared) { return std::nullopt; }
    const auto key = message_key(*shared, sender_public, crypto::x25519::public_from_private(scalar));
    return crypto::aead::open(key, ciphertext);
  };

  std::optional<crypto::bytes> plaintext;
  bool used_current = false;
  if (peer.ratchet.local.current) {
    plaintext = attempt(*peer.ratchet.local.current);
    used_current = plaintext.has_value();
  }
  if (not plaintext and peer.ratchet.local.previous) { plaintext = attempt(*peer.ratchet.local.previous); }
  if (not plaintext) {
    spdlog::debug("[ratchet_sealer] No ratchet key opens message from {}", peer.name);
    return std::nullopt;
  }

  auto record = model::decode(*plaintext);
  if (not record) { return std::nullopt; }
  if (used_current) { peer.ratchet.current_confirmed = true; }
  return record;
}

}// namespace courier::lifecycle
