#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace courier::core {

/**
 * @brief Random identifiers for messages, contacts and spool entries.
 */
class id_generator
{
public:
  /**
   * @brief Generates a random non-zero 64-bit id.
   */
  [[nodiscard]] static auto random_id() -> std::uint64_t;

  /**
   * @brief Generates a random non-zero id for which in_use returns false.
   *
   * @param in_use Predicate reporting ids already taken in the session
   */
  [[nodiscard]] static auto fresh_id(const std::function<bool(std::uint64_t)> &in_use) -> std::uint64_t;

  /**
   * @brief Generates a UUID string suitable for file names.
   *
   * @return UUID in canonical format (e.g., "550e8400-e29b-41d4-a716-446655440000")
   */
  [[nodiscard]] static auto token() -> std::string;
};

}// namespace courier::core
