#pragma once

#include <core/errors.hpp>
#include <memory>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <string>
#include <string_view>

namespace courier::crypto::detail {

struct pkey_deleter
{
  auto operator()(EVP_PKEY *key) const -> void { EVP_PKEY_free(key); }
};

struct pkey_ctx_deleter
{
  auto operator()(EVP_PKEY_CTX *ctx) const -> void { EVP_PKEY_CTX_free(ctx); }
};

struct md_ctx_deleter
{
  auto operator()(EVP_MD_CTX *ctx) const -> void { EVP_MD_CTX_free(ctx); }
};

struct cipher_ctx_deleter
{
  auto operator()(EVP_CIPHER_CTX *ctx) const -> void { EVP_CIPHER_CTX_free(ctx); }
};

struct kdf_deleter
{
  auto operator()(EVP_KDF *kdf) const -> void { EVP_KDF_free(kdf); }
};

struct kdf_ctx_deleter
{
  auto operator()(EVP_KDF_CTX *ctx) const -> void { EVP_KDF_CTX_free(ctx); }
};

using pkey_ptr = std::unique_ptr<EVP_PKEY, pkey_deleter>;
using pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, pkey_ctx_deleter>;
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;
using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, cipher_ctx_deleter>;
using kdf_ptr = std::unique_ptr<EVP_KDF, kdf_deleter>;
using kdf_ctx_ptr = std::unique_ptr<EVP_KDF_CTX, kdf_ctx_deleter>;

inline constexpr int openssl_ok = 1;

/// Throws a defect_error describing the last OpenSSL failure.
[[noreturn]] inline auto openssl_failure(std::string_view operation) -> void
{
  constexpr std::size_t error_buffer_size = 256;
  std::string reason(error_buffer_size, '\0');
  const auto code = ERR_get_error();
  if (code == 0) {
    reason = "unknown error";
  } else {
    ERR_error_string_n(code, reason.data(), reason.size());
    reason.resize(reason.find('\0'));
  }
  throw core::defect_error(std::string(operation) + ": " + reason);
}

}// namespace courier::crypto::detail
