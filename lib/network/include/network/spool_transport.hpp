#pragma once

#include <core/events.hpp>
#include <crypto/bytes.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace courier::network {

/**
 * @brief Delivery server stand-in backed by a shared directory.
 *
 * Each recipient has a mailbox directory named after the hex form of its public
 * identity value. A delivered record is one CBOR file; fetch returns the oldest file
 * in our own mailbox and release deletes it.
 */
class spool_transport
{
public:
  spool_transport(std::filesystem::path root, const crypto::key32 &own_identity);

  auto deliver(const core::events::delivery &item) -> bool;

  auto fetch() -> std::optional<core::events::fetched_record>;

  auto release(const std::string &handle) -> void;

  [[nodiscard]] auto mailbox() const -> const std::filesystem::path & { return mailbox_; }

  [[nodiscard]] static auto encode(const core::events::delivery &item) -> crypto::bytes;

  [[nodiscard]] static auto decode(std::span<const std::uint8_t> data) -> std::optional<core::events::fetched_record>;

private:
  std::filesystem::path root_;
  std::filesystem::path mailbox_;
};

}// namespace courier::network
