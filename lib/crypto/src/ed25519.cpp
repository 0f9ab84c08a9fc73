#include <crypto/ed25519.hpp>

#include "openssl_handles.hpp"
#include <crypto/random.hpp>

namespace courier::crypto::ed25519 {

namespace {

  auto load_private(const key32 &private_key) -> detail::pkey_ptr
  {
    detail::pkey_ptr key(
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, private_key.data(), private_key.size()));
    if (not key) { detail::openssl_failure("load ed25519 private key"); }
    return key;
  }

}// namespace

auto generate() -> keypair
{
  keypair pair;
  pair.private_key = random_key();
  pair.public_key = public_from_private(pair.private_key);
  return pair;
}

auto public_from_private(const key32 &private_key) -> key32
{
  const auto key = load_private(private_key);
  key32 public_key{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &length) != detail::openssl_ok
      or length != public_key.size()) {
    detail::openssl_failure("ed25519 public key");
  }
  return public_key;
}

auto sign(const key32 &private_key, std::span<const std::uint8_t> message) -> signature_t
{
  const auto key = load_private(private_key);
  const detail::md_ctx_ptr ctx(EVP_MD_CTX_new());
  if (not ctx) { detail::openssl_failure("EVP_MD_CTX_new"); }

  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != detail::openssl_ok) {
    detail::openssl_failure("EVP_DigestSignInit");
  }

  signature_t signature{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(), message.size()) != detail::openssl_ok
      or length != signature.size()) {
    detail::openssl_failure("EVP_DigestSign");
  }
  return signature;
}

auto verify(std::span<const std::uint8_t> public_key,
  std::span<const std::uint8_t> message,
  std::span<const std::uint8_t> signature) -> bool
{
  if (public_key.size() != key_size or signature.size() != signature_size) { return false; }

  const detail::pkey_ptr key(
    EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
  if (not key) {
    ERR_clear_error();
    return false;
  }

  const detail::md_ctx_ptr ctx(EVP_MD_CTX_new());
  if (not ctx) { detail::openssl_failure("EVP_MD_CTX_new"); }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != detail::openssl_ok) {
    ERR_clear_error();
    return false;
  }

  const auto result =
    EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size());
  if (result != detail::openssl_ok) { ERR_clear_error(); }
  return result == detail::openssl_ok;
}

}// namespace courier::crypto::ed25519
