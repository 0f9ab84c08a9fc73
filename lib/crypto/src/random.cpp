#include <crypto/random.hpp>

#include "openssl_handles.hpp"
#include <openssl/rand.h>

namespace courier::crypto {

auto fill_random(std::span<std::uint8_t> out) -> void
{
  if (out.empty()) { return; }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != detail::openssl_ok) {
    detail::openssl_failure("RAND_bytes");
  }
}

auto random_key() -> key32
{
  key32 key{};
  fill_random(key);
  return key;
}

auto random_bytes(std::size_t count) -> bytes
{
  bytes out(count);
  fill_random(out);
  return out;
}

}// namespace courier::crypto
