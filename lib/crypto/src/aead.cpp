#include <crypto/aead.hpp>

#include "openssl_handles.hpp"
#include <crypto/random.hpp>

namespace courier::crypto::aead {

auto seal(const key32 &key, std::span<const std::uint8_t> plaintext, std::span<const std::uint8_t> associated_data)
  -> bytes
{
  bytes output(nonce_size + plaintext.size() + tag_size);
  const std::span<std::uint8_t> nonce(output.data(), nonce_size);
  fill_random(nonce);

  const detail::cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new());
  if (not ctx) { detail::openssl_failure("EVP_CIPHER_CTX_new"); }
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != detail::openssl_ok) {
    detail::openssl_failure("EVP_EncryptInit_ex");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce_size), nullptr)
      != detail::openssl_ok) {
    detail::openssl_failure("set GCM nonce length");
  }
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != detail::openssl_ok) {
    detail::openssl_failure("set GCM key");
  }

  int length = 0;
  if (not associated_data.empty()
      and EVP_EncryptUpdate(
            ctx.get(), nullptr, &length, associated_data.data(), static_cast<int>(associated_data.size()))
            != detail::openssl_ok) {
    detail::openssl_failure("GCM associated data");
  }

  auto *ciphertext = output.data() + nonce_size;
  int written = 0;
  if (EVP_EncryptUpdate(ctx.get(), ciphertext, &written, plaintext.data(), static_cast<int>(plaintext.size()))
      != detail::openssl_ok) {
    detail::openssl_failure("EVP_EncryptUpdate");
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + written, &final_len) != detail::openssl_ok) {
    detail::openssl_failure("EVP_EncryptFinal_ex");
  }
  written += final_len;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag_size), ciphertext + written)
      != detail::openssl_ok) {
    detail::openssl_failure("get GCM tag");
  }
  return output;
}

auto open(const key32 &key, std::span<const std::uint8_t> sealed, std::span<const std::uint8_t> associated_data)
  -> std::optional<bytes>
{
  if (sealed.size() < overhead) { return std::nullopt; }

  const auto nonce = sealed.first(nonce_size);
  const auto ciphertext = sealed.subspan(nonce_size, sealed.size() - overhead);
  bytes tag(sealed.end() - static_cast<std::ptrdiff_t>(tag_size), sealed.end());

  const detail::cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new());
  if (not ctx) { detail::openssl_failure("EVP_CIPHER_CTX_new"); }
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != detail::openssl_ok) {
    detail::openssl_failure("EVP_DecryptInit_ex");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce_size), nullptr)
      != detail::openssl_ok) {
    detail::openssl_failure("set GCM nonce length");
  }
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != detail::openssl_ok) {
    detail::openssl_failure("set GCM key");
  }

  int length = 0;
  if (not associated_data.empty()
      and EVP_DecryptUpdate(
            ctx.get(), nullptr, &length, associated_data.data(), static_cast<int>(associated_data.size()))
            != detail::openssl_ok) {
    detail::openssl_failure("GCM associated data");
  }

  bytes plaintext(ciphertext.size());
  int written = 0;
  if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &written, ciphertext.data(), static_cast<int>(ciphertext.size()))
      != detail::openssl_ok) {
    detail::openssl_failure("EVP_DecryptUpdate");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag_size), tag.data())
      != detail::openssl_ok) {
    detail::openssl_failure("set GCM tag");
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &final_len) != detail::openssl_ok) {
    ERR_clear_error();
    return std::nullopt;
  }
  plaintext.resize(static_cast<std::size_t>(written + final_len));
  return plaintext;
}

}// namespace courier::crypto::aead
