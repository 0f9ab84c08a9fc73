#include <crypto/kdf.hpp>

#include "openssl_handles.hpp"
#include <array>
#include <openssl/core_names.h>
#include <openssl/params.h>
#include <string>

namespace courier::crypto::kdf {

auto scrypt(std::string_view passphrase, std::span<const std::uint8_t> salt, const scrypt_params &params) -> key32
{
  // 128 * r * N * p bytes of working memory, plus headroom
  const std::uint64_t max_memory = (128U * params.r * params.n * params.p) * 2U;

  key32 key{};
  if (EVP_PBE_scrypt(passphrase.data(),
        passphrase.size(),
        salt.data(),
        salt.size(),
        params.n,
        params.r,
        params.p,
        max_memory,
        key.data(),
        key.size())
      != detail::openssl_ok) {
    detail::openssl_failure("EVP_PBE_scrypt");
  }
  return key;
}

auto hkdf_sha256(std::span<const std::uint8_t> ikm, std::span<const std::uint8_t> salt, std::string_view info) -> key32
{
  if (ikm.empty()) { throw core::defect_error("hkdf: empty input keying material"); }

  const detail::kdf_ptr kdf(EVP_KDF_fetch(nullptr, "HKDF", nullptr));
  if (not kdf) { detail::openssl_failure("EVP_KDF_fetch(HKDF)"); }
  const detail::kdf_ctx_ptr ctx(EVP_KDF_CTX_new(kdf.get()));
  if (not ctx) { detail::openssl_failure("EVP_KDF_CTX_new"); }

  std::string digest{ "SHA256" };
  std::string info_copy{ info };
  std::array<OSSL_PARAM, 5> params{};
  std::size_t index = 0;
  params.at(index++) = OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest.data(), 0);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  params.at(index++) = OSSL_PARAM_construct_octet_string(
    OSSL_KDF_PARAM_KEY, const_cast<std::uint8_t *>(ikm.data()), ikm.size());
  if (not salt.empty()) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    params.at(index++) = OSSL_PARAM_construct_octet_string(
      OSSL_KDF_PARAM_SALT, const_cast<std::uint8_t *>(salt.data()), salt.size());
  }
  if (not info_copy.empty()) {
    params.at(index++) = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO, info_copy.data(), info_copy.size());
  }
  params.at(index) = OSSL_PARAM_construct_end();

  key32 key{};
  if (EVP_KDF_derive(ctx.get(), key.data(), key.size(), params.data()) != detail::openssl_ok) {
    detail::openssl_failure("EVP_KDF_derive(HKDF)");
  }
  return key;
}

}// namespace courier::crypto::kdf
