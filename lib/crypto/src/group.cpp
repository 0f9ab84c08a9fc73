#include <crypto/group.hpp>

#include <algorithm>
#include <crypto/ed25519.hpp>
#include <crypto/random.hpp>
#include <string_view>

namespace courier::crypto::group {

namespace {

  constexpr std::string_view membership_context{ "courier-member" };

  auto signed_message(const key32 &group_public, const std::array<std::uint8_t, tag_size> &tag) -> bytes
  {
    bytes message(membership_context.begin(), membership_context.end());
    message.insert(message.end(), group_public.begin(), group_public.end());
    message.insert(message.end(), tag.begin(), tag.end());
    return message;
  }

}// namespace

auto member_credential::tag_value() const -> std::uint64_t
{
  std::uint64_t value = 0;
  for (const auto byte : tag) { value = (value << 8U) | byte; }
  return value;
}

auto member_credential::serialize() const -> bytes
{
  bytes out(tag.begin(), tag.end());
  out.insert(out.end(), signature.begin(), signature.end());
  return out;
}

auto descriptor(const key32 &group_private) -> key32 { return ed25519::public_from_private(group_private); }

auto issue(const key32 &group_private) -> member_credential
{
  member_credential credential;
  fill_random(credential.tag);
  credential.signature = ed25519::sign(group_private, signed_message(descriptor(group_private), credential.tag));
  return credential;
}

auto parse_descriptor(std::span<const std::uint8_t> data) -> std::optional<key32>
{
  key32 group_public{};
  if (not copy_key(data, group_public)) { return std::nullopt; }
  // a descriptor must be usable as a verification key
  if (is_zero(group_public)) { return std::nullopt; }
  return group_public;
}

auto parse_credential(const key32 &group_public, std::span<const std::uint8_t> data)
  -> std::optional<member_credential>
{
  if (data.size() != credential_size) { return std::nullopt; }

  member_credential credential;
  std::ranges::copy(data.first(tag_size), credential.tag.begin());
  std::ranges::copy(data.subspan(tag_size), credential.signature.begin());

  if (not ed25519::verify(group_public, signed_message(group_public, credential.tag), credential.signature)) {
    return std::nullopt;
  }
  return credential;
}

}// namespace courier::crypto::group
