#include <model/message_record.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace courier::model {

namespace {

  using nlohmann::json;

  constexpr std::size_t u64_width = 8;

  auto pack_u64(std::uint64_t value) -> json
  {
    json::binary_t::container_type out(u64_width);
    for (std::size_t i = 0; i < u64_width; ++i) {
      out[u64_width - 1 - i] = static_cast<std::uint8_t>(value & 0xFFU);
      value >>= 8U;
    }
    return json::binary(std::move(out));
  }

  auto unpack_u64(const json &field) -> std::uint64_t
  {
    const auto &raw = field.get_binary();
    if (raw.size() != u64_width) { throw std::invalid_argument("fixed-width field has wrong length"); }
    std::uint64_t value = 0;
    for (const auto byte : raw) { value = (value << 8U) | byte; }
    return value;
  }

  auto to_json(const message_record &record) -> json
  {
    json doc = json::object();
    doc["id"] = pack_u64(record.id);
    doc["time"] = pack_u64(static_cast<std::uint64_t>(record.time));
    doc["body"] = json::binary(record.body);
    doc["enc"] = static_cast<std::uint8_t>(record.encoding);
    if (record.in_reply_to) { doc["reply"] = pack_u64(*record.in_reply_to); }
    doc["dh"] = json::binary(crypto::bytes(record.my_next_dh.begin(), record.my_next_dh.end()));
    if (not record.attachments.empty()) {
      auto files = json::array();
      for (const auto &file : record.attachments) {
        files.push_back(json{ { "name", file.filename }, { "data", json::binary(file.contents) } });
      }
      doc["files"] = std::move(files);
    }
    return doc;
  }

}// namespace

auto encode(const message_record &record) -> crypto::bytes { return json::to_cbor(to_json(record)); }

auto decode(std::span<const std::uint8_t> data) -> std::optional<message_record>
{
  try {
    const auto doc = json::from_cbor(data.begin(), data.end());

    message_record record;
    record.id = unpack_u64(doc.at("id"));
    record.time = static_cast<std::int64_t>(unpack_u64(doc.at("time")));
    record.body = doc.at("body").get_binary();
    if (doc.at("enc").get<std::uint8_t>() != static_cast<std::uint8_t>(body_encoding::raw)) { return std::nullopt; }
    if (doc.contains("reply")) { record.in_reply_to = unpack_u64(doc.at("reply")); }
    if (not crypto::copy_key(doc.at("dh").get_binary(), record.my_next_dh)) { return std::nullopt; }
    if (doc.contains("files")) {
      for (const auto &file : doc.at("files")) {
        record.attachments.push_back(
          attachment{ .filename = file.at("name").get<std::string>(), .contents = file.at("data").get_binary() });
      }
    }
    if (record.id == 0) { return std::nullopt; }
    return record;
  } catch (const json::exception &e) {
    spdlog::debug("[message_record] Rejecting record: {}", e.what());
  } catch (const std::invalid_argument &e) {
    spdlog::debug("[message_record] Rejecting record: {}", e.what());
  }
  return std::nullopt;
}

auto serialized_size(const message_record &record) -> std::size_t { return encode(record).size(); }

auto body_text(const message_record &record) -> std::string { return crypto::to_string(record.body); }

}// namespace courier::model
