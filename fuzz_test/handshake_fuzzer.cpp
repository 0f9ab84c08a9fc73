#include <cstddef>
#include <cstdint>
#include <handshake/handshake.hpp>
#include <model/contact.hpp>
#include <model/identity.hpp>
#include <span>
#include <stdexcept>
#include <tuple>

namespace {

/// Pending contact with our own key exchange generated, created once per process.
auto pending_contact() -> const courier::model::contact &
{
  static const courier::model::contact pending = [] {
    const auto self = courier::model::identity::create("courier://fuzz@relay.example");
    courier::model::contact peer{ .id = 1, .name = "fuzz" };
    std::ignore = courier::handshake::generate(peer, self);
    return peer;
  }();
  return pending;
}

}// namespace

// Fuzzer that applies arbitrary bytes as a peer key exchange. A rejected record
// must leave the contact exactly as it was.
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  auto contact = pending_contact();
  const std::span<const std::uint8_t> record(Data, Size);

  if (courier::handshake::apply(contact, record, { .allow_any_host = true })) {
    if (not(contact == pending_contact())) { throw std::logic_error("rejected key exchange modified the contact"); }
  }

  return 0;
}
