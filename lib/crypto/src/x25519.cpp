#include <crypto/x25519.hpp>

#include "openssl_handles.hpp"
#include <crypto/random.hpp>

namespace courier::crypto::x25519 {

namespace {

  auto load_private(const key32 &private_key) -> detail::pkey_ptr
  {
    detail::pkey_ptr key(
      EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, private_key.data(), private_key.size()));
    if (not key) { detail::openssl_failure("load x25519 private key"); }
    return key;
  }

}// namespace

auto generate_private() -> key32 { return random_key(); }

auto public_from_private(const key32 &private_key) -> key32
{
  const auto key = load_private(private_key);
  key32 public_key{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &length) != detail::openssl_ok
      or length != public_key.size()) {
    detail::openssl_failure("x25519 public key");
  }
  return public_key;
}

auto shared_secret(const key32 &private_key, std::span<const std::uint8_t> peer_public) -> std::optional<key32>
{
  if (peer_public.size() != key_size) { return std::nullopt; }

  const auto key = load_private(private_key);
  const detail::pkey_ptr peer(
    EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peer_public.data(), peer_public.size()));
  if (not peer) {
    ERR_clear_error();
    return std::nullopt;
  }

  const detail::pkey_ctx_ptr ctx(EVP_PKEY_CTX_new(key.get(), nullptr));
  if (not ctx) { detail::openssl_failure("EVP_PKEY_CTX_new"); }
  if (EVP_PKEY_derive_init(ctx.get()) != detail::openssl_ok) { detail::openssl_failure("EVP_PKEY_derive_init"); }
  if (EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) != detail::openssl_ok) {
    ERR_clear_error();
    return std::nullopt;
  }

  key32 secret{};
  auto length = secret.size();
  if (EVP_PKEY_derive(ctx.get(), secret.data(), &length) != detail::openssl_ok or length != secret.size()) {
    ERR_clear_error();
    return std::nullopt;
  }
  return secret;
}

auto is_usable_public(std::span<const std::uint8_t> peer_public) -> bool
{
  // Clamping clears the cofactor bits, so one fixed scalar sends every low-order point to zero.
  static constexpr key32 test_scalar = [] {
    key32 scalar{};
    scalar.fill(0x5A);
    return scalar;
  }();
  return shared_secret(test_scalar, peer_public).has_value();
}

}// namespace courier::crypto::x25519
