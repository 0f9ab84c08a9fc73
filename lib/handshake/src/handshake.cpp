#include <handshake/handshake.hpp>

#include <core/errors.hpp>
#include <crypto/armor.hpp>
#include <crypto/ed25519.hpp>
#include <crypto/group.hpp>
#include <crypto/x25519.hpp>
#include <handshake/server_address.hpp>
#include <limits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <tuple>

namespace courier::handshake {

namespace {

  using nlohmann::json;

  /// Fields following the signer's key in the signed payload
  struct payload_fields
  {
    crypto::bytes identity_public;
    std::string server;
    crypto::bytes dh;
    crypto::bytes group;
    crypto::bytes group_key;
    std::uint32_t generation{ 0 };
  };

  struct envelope
  {
    crypto::bytes signed_payload;
    crypto::bytes signature;
  };

  auto as_binary(std::span<const std::uint8_t> data) -> json
  {
    return json::binary(crypto::bytes(data.begin(), data.end()));
  }

  auto binary_field(const json &doc, const char *name) -> crypto::bytes
  {
    const auto &value = doc.at(name);
    if (not value.is_binary()) { throw std::invalid_argument(name); }
    return value.get_binary();
  }

  auto parse_envelope(std::span<const std::uint8_t> data) -> std::optional<envelope>
  {
    try {
      const auto doc = json::from_cbor(data.begin(), data.end());
      envelope result{ .signed_payload = binary_field(doc, "signed"), .signature = binary_field(doc, "signature") };
      if (result.signature.size() != crypto::signature_size) { return std::nullopt; }
      return result;
    } catch (const json::exception &) {
      return std::nullopt;
    } catch (const std::invalid_argument &) {
      return std::nullopt;
    }
  }

  auto parse_fields(std::span<const std::uint8_t> data) -> std::optional<payload_fields>
  {
    try {
      const auto doc = json::from_cbor(data.begin(), data.end());
      const auto &generation = doc.at("generation");
      if (not generation.is_number_unsigned()
          or generation.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        return std::nullopt;
      }
      if (not doc.at("server").is_string()) { return std::nullopt; }
      return payload_fields{ .identity_public = binary_field(doc, "identity_public"),
        .server = doc.at("server").get<std::string>(),
        .dh = binary_field(doc, "dh"),
        .group = binary_field(doc, "group"),
        .group_key = binary_field(doc, "group_key"),
        .generation = generation.get<std::uint32_t>() };
    } catch (const json::exception &) {
      return std::nullopt;
    } catch (const std::invalid_argument &) {
      return std::nullopt;
    }
  }

}// namespace

auto generate(model::contact &contact, const model::identity &self) -> crypto::bytes
{
  const auto dh_public = contact.ratchet.seed_local();
  const auto credential = crypto::group::issue(self.group_private);
  contact.issued_credential = credential;

  const auto group_public = crypto::group::descriptor(self.group_private);
  const json fields{ { "identity_public", as_binary(self.identity_public) },
    { "server", self.server },
    { "dh", as_binary(dh_public) },
    { "group", as_binary(group_public) },
    { "group_key", as_binary(credential.serialize()) },
    { "generation", self.generation } };

  crypto::bytes signed_payload(self.signing.public_key.begin(), self.signing.public_key.end());
  const auto encoded_fields = json::to_cbor(fields);
  signed_payload.insert(signed_payload.end(), encoded_fields.begin(), encoded_fields.end());

  const auto signature = crypto::ed25519::sign(self.signing.private_key, signed_payload);

  const json outer{ { "signed", as_binary(signed_payload) }, { "signature", as_binary(signature) } };
  contact.handshake_bytes = json::to_cbor(outer);
  return contact.handshake_bytes;
}

auto apply(model::contact &contact, std::span<const std::uint8_t> record, const apply_options &options)
  -> std::error_code
{
  using core::errc;

  if (not contact.pending) { return errc::contact_not_pending; }

  const auto outer = parse_envelope(record);
  if (not outer) { return errc::malformed_handshake; }

  const std::span<const std::uint8_t> payload{ outer->signed_payload };
  if (payload.size() < crypto::key_size) { return errc::invalid_public_key; }
  crypto::key32 their_public_key{};
  std::ignore = crypto::copy_key(payload.first(crypto::key_size), their_public_key);

  if (not crypto::ed25519::verify(their_public_key, payload, outer->signature)) { return errc::invalid_signature; }

  const auto fields = parse_fields(payload.subspan(crypto::key_size));
  if (not fields) { return errc::malformed_handshake; }

  if (not parse_server(fields->server, options.allow_any_host)) {
    spdlog::debug("[handshake] Rejecting server address {}", fields->server);
    return errc::invalid_address;
  }

  const auto group = crypto::group::parse_descriptor(fields->group);
  if (not group) { return errc::invalid_group_credential; }
  if (not crypto::group::parse_credential(*group, fields->group_key)) { return errc::invalid_group_credential; }

  crypto::key32 identity_public{};
  if (not crypto::copy_key(fields->identity_public, identity_public)) { return errc::invalid_public_key; }
  crypto::key32 dh{};
  if (not crypto::copy_key(fields->dh, dh) or not crypto::x25519::is_usable_public(dh)) {
    return errc::invalid_dh_value;
  }

  contact.their_public_key = their_public_key;
  contact.their_identity_public = identity_public;
  contact.their_server = fields->server;
  contact.their_group = *group;
  contact.received_credential = fields->group_key;
  contact.generation = fields->generation;
  contact.ratchet.seed_remote(dh);
  contact.handshake_bytes.clear();
  contact.pending = false;
  return {};
}

auto armor(std::span<const std::uint8_t> record) -> std::string { return crypto::armor(armor_label, record); }

auto dearmor(std::string_view text) -> std::optional<crypto::bytes> { return crypto::dearmor(armor_label, text); }

}// namespace courier::handshake
