#pragma once

#include <cstddef>
#include <model/message_record.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace courier::lifecycle {

struct usage_estimate
{
  std::size_t used{ 0 };
  std::size_t limit{ model::max_serialized_message };
  bool over_limit{ false };

  [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Serialized size a draft would have once composed.
 *
 * Agrees exactly with the check compose() applies.
 */
[[nodiscard]] auto estimate_usage(std::string_view body,
  bool is_reply,
  const std::vector<model::attachment> &attachments = {}) -> usage_estimate;

/// Body actually sent for a user draft; an empty body is reserved for acknowledgements.
[[nodiscard]] auto effective_body(std::string_view body) -> std::string;

/// Record with the same field widths as a composed one, used for size checks.
[[nodiscard]] auto placeholder_record(std::string_view body,
  bool is_reply,
  const std::vector<model::attachment> &attachments) -> model::message_record;

}// namespace courier::lifecycle
