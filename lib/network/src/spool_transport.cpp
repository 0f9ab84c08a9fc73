#include <network/spool_transport.hpp>

#include <algorithm>
#include <chrono>
#include <core/id_generator.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <system_error>
#include <vector>

namespace courier::network {

namespace {

  constexpr auto spool_extension = ".msg";

  auto write_entry(const std::filesystem::path &directory, std::span<const std::uint8_t> contents) -> void
  {
    // Names sort by arrival so fetch returns records in delivery order.
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto stem = fmt::format(
      "{:020}-{}", std::chrono::duration_cast<std::chrono::nanoseconds>(now).count(), core::id_generator::token());

    const auto temporary = directory / (stem + ".tmp");
    {
      std::ofstream output(temporary, std::ios::binary | std::ios::trunc);
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      output.write(reinterpret_cast<const char *>(contents.data()), static_cast<std::streamsize>(contents.size()));
      if (not output) {
        throw std::filesystem::filesystem_error(
          "cannot write spool entry", temporary, std::make_error_code(std::errc::io_error));
      }
    }
    std::filesystem::rename(temporary, directory / (stem + spool_extension));
  }

  auto read_entry(const std::filesystem::path &path) -> crypto::bytes
  {
    std::ifstream input(path, std::ios::binary);
    return { std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>() };
  }

}// namespace

spool_transport::spool_transport(std::filesystem::path root, const crypto::key32 &own_identity)
  : root_(std::move(root)), mailbox_(root_ / crypto::to_hex(own_identity))
{
  std::filesystem::create_directories(mailbox_);
}

auto spool_transport::encode(const core::events::delivery &item) -> crypto::bytes
{
  const nlohmann::json entry = { { "credential", nlohmann::json::binary(item.credential) },
    { "generation", item.generation },
    { "payload", nlohmann::json::binary(item.payload) } };
  return nlohmann::json::to_cbor(entry);
}

auto spool_transport::decode(std::span<const std::uint8_t> data) -> std::optional<core::events::fetched_record>
{
  try {
    const auto entry = nlohmann::json::from_cbor(data.begin(), data.end());
    core::events::fetched_record record;
    record.credential = entry.at("credential").get_binary();
    record.generation = entry.at("generation").get<std::uint32_t>();
    record.payload = entry.at("payload").get_binary();
    return record;
  } catch (const nlohmann::json::exception &e) {
    spdlog::debug("[spool] Undecodable entry: {}", e.what());
    return std::nullopt;
  }
}

auto spool_transport::deliver(const core::events::delivery &item) -> bool
{
  if (item.to_identity.size() != crypto::key_size) {
    spdlog::error("[spool] Delivery {:016x} has no recipient identity", item.id);
    return false;
  }

  try {
    const auto directory = root_ / crypto::to_hex(item.to_identity);
    std::filesystem::create_directories(directory);
    write_entry(directory, encode(item));
    return true;
  } catch (const std::filesystem::filesystem_error &e) {
    spdlog::warn("[spool] Delivery {:016x} failed: {}", item.id, e.what());
    return false;
  }
}

auto spool_transport::fetch() -> std::optional<core::events::fetched_record>
{
  std::vector<std::filesystem::path> entries;
  std::error_code error;
  for (const auto &entry : std::filesystem::directory_iterator(mailbox_, error)) {
    if (entry.is_regular_file() and entry.path().extension() == spool_extension) { entries.push_back(entry.path()); }
  }
  if (error) {
    spdlog::warn("[spool] Cannot list {}: {}", mailbox_.string(), error.message());
    return std::nullopt;
  }
  std::ranges::sort(entries);

  for (const auto &path : entries) {
    auto record = decode(read_entry(path));
    if (record) {
      record->handle = path.string();
      return record;
    }
    spdlog::warn("[spool] Discarding unreadable entry {}", path.filename().string());
    release(path.string());
  }
  return std::nullopt;
}

auto spool_transport::release(const std::string &handle) -> void
{
  std::error_code error;
  if (not std::filesystem::remove(handle, error) and error) {
    spdlog::warn("[spool] Cannot remove {}: {}", handle, error.message());
  }
}

}// namespace courier::network
