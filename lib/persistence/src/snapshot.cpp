#include <persistence/snapshot.hpp>

#include <core/errors.hpp>
#include <crypto/ed25519.hpp>
#include <crypto/x25519.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace courier::persistence {

namespace {

  using nlohmann::json;

  auto binary(std::span<const std::uint8_t> data) -> json
  {
    return json::binary(crypto::bytes(data.begin(), data.end()));
  }

  auto optional_key(const std::optional<crypto::key32> &key) -> json { return key ? binary(*key) : json(nullptr); }

  auto read_bytes(const json &doc, const char *name) -> crypto::bytes { return doc.at(name).get_binary(); }

  auto read_key(const json &doc, const char *name) -> crypto::key32
  {
    crypto::key32 key{};
    if (not crypto::copy_key(doc.at(name).get_binary(), key)) { core::raise(core::errc::corrupt_state, name); }
    return key;
  }

  auto read_optional_key(const json &doc, const char *name) -> std::optional<crypto::key32>
  {
    if (doc.at(name).is_null()) { return std::nullopt; }
    return read_key(doc, name);
  }

  auto encode_identity(const model::identity &self) -> json
  {
    return { { "signing_private", binary(self.signing.private_key) },
      { "identity_private", binary(self.identity_private) },
      { "group_private", binary(self.group_private) },
      { "generation", self.generation },
      { "server", self.server } };
  }

  auto decode_identity(const json &doc) -> model::identity
  {
    model::identity self;
    self.signing.private_key = read_key(doc, "signing_private");
    self.signing.public_key = crypto::ed25519::public_from_private(self.signing.private_key);
    self.identity_private = read_key(doc, "identity_private");
    self.identity_public = crypto::x25519::public_from_private(self.identity_private);
    self.group_private = read_key(doc, "group_private");
    self.generation = doc.at("generation").get<std::uint32_t>();
    self.server = doc.at("server").get<std::string>();
    return self;
  }

  auto encode_contact(const model::contact &peer) -> json
  {
    return { { "id", peer.id },
      { "name", peer.name },
      { "pending", peer.pending },
      { "handshake", binary(peer.handshake_bytes) },
      { "issued", peer.issued_credential ? binary(peer.issued_credential->serialize()) : json(nullptr) },
      { "received", binary(peer.received_credential) },
      { "their_group", binary(peer.their_group) },
      { "generation", peer.generation },
      { "their_server", peer.their_server },
      { "their_public_key", binary(peer.their_public_key) },
      { "their_identity_public", binary(peer.their_identity_public) },
      { "ratchet",
        { { "local_previous", optional_key(peer.ratchet.local.previous) },
          { "local_current", optional_key(peer.ratchet.local.current) },
          { "remote_previous", optional_key(peer.ratchet.remote.previous) },
          { "remote_current", optional_key(peer.ratchet.remote.current) },
          { "confirmed", peer.ratchet.current_confirmed } } } };
  }

  auto decode_contact(const json &doc, const crypto::key32 &own_group) -> model::contact
  {
    model::contact peer;
    peer.id = doc.at("id").get<std::uint64_t>();
    peer.name = doc.at("name").get<std::string>();
    peer.pending = doc.at("pending").get<bool>();
    peer.handshake_bytes = read_bytes(doc, "handshake");
    if (not doc.at("issued").is_null()) {
      peer.issued_credential = crypto::group::parse_credential(own_group, doc.at("issued").get_binary());
      if (not peer.issued_credential) { core::raise(core::errc::corrupt_state, "issued credential"); }
    }
    peer.received_credential = read_bytes(doc, "received");
    peer.their_group = read_key(doc, "their_group");
    peer.generation = doc.at("generation").get<std::uint32_t>();
    peer.their_server = doc.at("their_server").get<std::string>();
    peer.their_public_key = read_key(doc, "their_public_key");
    peer.their_identity_public = read_key(doc, "their_identity_public");

    const auto &ratchet = doc.at("ratchet");
    peer.ratchet.local.previous = read_optional_key(ratchet, "local_previous");
    peer.ratchet.local.current = read_optional_key(ratchet, "local_current");
    peer.ratchet.remote.previous = read_optional_key(ratchet, "remote_previous");
    peer.ratchet.remote.current = read_optional_key(ratchet, "remote_current");
    peer.ratchet.current_confirmed = ratchet.at("confirmed").get<bool>();
    return peer;
  }

  auto encode_inbound(const model::inbound_message &msg) -> json
  {
    json doc{ { "id", msg.id },
      { "read", msg.read },
      { "received", msg.received },
      { "from", msg.from },
      { "acked", msg.acked } };
    if (const auto *record = msg.record()) {
      doc["record"] = binary(model::encode(*record));
    } else {
      doc["sealed"] = binary(std::get<model::sealed_payload>(msg.content).ciphertext);
    }
    return doc;
  }

  auto decode_record(const json &field) -> model::message_record
  {
    auto record = model::decode(field.get_binary());
    if (not record) { core::raise(core::errc::corrupt_state, "message record"); }
    return std::move(*record);
  }

  auto decode_inbound(const json &doc) -> model::inbound_message
  {
    model::inbound_message msg;
    msg.id = doc.at("id").get<std::uint64_t>();
    msg.read = doc.at("read").get<bool>();
    msg.received = doc.at("received").get<std::int64_t>();
    msg.from = doc.at("from").get<std::uint64_t>();
    msg.acked = doc.at("acked").get<bool>();
    if (doc.contains("record")) {
      msg.content = decode_record(doc.at("record"));
    } else {
      msg.content = model::sealed_payload{ .ciphertext = read_bytes(doc, "sealed") };
    }
    return msg;
  }

  auto encode_outbound(const model::outbound_message &msg) -> json
  {
    return { { "id", msg.id },
      { "to", msg.to },
      { "server", msg.server },
      { "created", msg.created },
      { "sent", msg.sent },
      { "acked", msg.acked },
      { "record", binary(model::encode(msg.record)) },
      { "sealed", binary(msg.sealed) } };
  }

  auto decode_outbound(const json &doc) -> model::outbound_message
  {
    return { .id = doc.at("id").get<std::uint64_t>(),
      .to = doc.at("to").get<std::uint64_t>(),
      .server = doc.at("server").get<std::string>(),
      .created = doc.at("created").get<std::int64_t>(),
      .sent = doc.at("sent").get<std::int64_t>(),
      .acked = doc.at("acked").get<std::int64_t>(),
      .record = decode_record(doc.at("record")),
      .sealed = read_bytes(doc, "sealed") };
  }

  auto rebuild_queue(model::session_state &state) -> void
  {
    for (const auto &msg : state.outbox) {
      if (msg.sent != 0) { continue; }
      const auto *peer = state.find_contact(msg.to);
      state.queue->enqueue(core::events::delivery{ .id = msg.id,
        .to = msg.to,
        .server = msg.server,
        .to_identity = crypto::bytes(peer->their_identity_public.begin(), peer->their_identity_public.end()),
        .credential = peer->received_credential,
        .generation = peer->generation,
        .payload = msg.sealed });
    }
  }

  auto validate_references(const model::session_state &state) -> void
  {
    for (const auto &msg : state.inbox) {
      if (state.find_contact(msg.from) == nullptr) { core::raise(core::errc::corrupt_state, "inbound sender"); }
    }
    for (const auto &msg : state.outbox) {
      if (state.find_contact(msg.to) == nullptr) { core::raise(core::errc::corrupt_state, "outbound recipient"); }
    }
  }

}// namespace

auto serialize(const model::session_state &state) -> crypto::bytes
{
  json doc{ { "version", snapshot_version }, { "identity", encode_identity(state.self) } };

  auto contacts = json::array();
  for (const auto &[id, peer] : state.contacts) { contacts.push_back(encode_contact(peer)); }
  doc["contacts"] = std::move(contacts);

  auto inbox = json::array();
  for (const auto &msg : state.inbox) { inbox.push_back(encode_inbound(msg)); }
  doc["inbox"] = std::move(inbox);

  auto outbox = json::array();
  for (const auto &msg : state.outbox) { outbox.push_back(encode_outbound(msg)); }
  doc["outbox"] = std::move(outbox);

  return json::to_cbor(doc);
}

auto deserialize(std::span<const std::uint8_t> data) -> model::session_state
{
  try {
    const auto doc = json::from_cbor(data.begin(), data.end());
    if (doc.at("version").get<std::uint32_t>() != snapshot_version) {
      core::raise(core::errc::corrupt_state, "unsupported snapshot version");
    }

    model::session_state state;
    state.self = decode_identity(doc.at("identity"));
    const auto own_group = crypto::group::descriptor(state.self.group_private);

    for (const auto &entry : doc.at("contacts")) {
      auto peer = decode_contact(entry, own_group);
      if (peer.id == 0 or state.contacts.contains(peer.id)) { core::raise(core::errc::corrupt_state, "contact id"); }
      state.contacts.emplace(peer.id, std::move(peer));
    }
    for (const auto &entry : doc.at("inbox")) { state.inbox.push_back(decode_inbound(entry)); }
    for (const auto &entry : doc.at("outbox")) { state.outbox.push_back(decode_outbound(entry)); }

    validate_references(state);
    rebuild_queue(state);
    return state;
  } catch (const json::exception &e) {
    spdlog::error("[snapshot] Cannot parse state: {}", e.what());
    core::raise(core::errc::corrupt_state, e.what());
  }
}

}// namespace courier::persistence
