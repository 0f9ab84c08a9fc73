#include <lifecycle/usage.hpp>

#include <crypto/bytes.hpp>
#include <fmt/format.h>

namespace courier::lifecycle {

namespace {

  constexpr std::int64_t placeholder_time = std::int64_t{ 1 } << 62;

}// namespace

auto usage_estimate::to_string() const -> std::string { return fmt::format("{} of {} bytes", used, limit); }

auto effective_body(std::string_view body) -> std::string
{
  return body.empty() ? std::string(" ") : std::string(body);
}

auto placeholder_record(std::string_view body, bool is_reply, const std::vector<model::attachment> &attachments)
  -> model::message_record
{
  model::message_record record;
  record.id = 0;
  record.time = placeholder_time;
  record.body = crypto::to_bytes(body);
  if (is_reply) { record.in_reply_to = 0; }
  record.attachments = attachments;
  return record;
}

auto estimate_usage(std::string_view body, bool is_reply, const std::vector<model::attachment> &attachments)
  -> usage_estimate
{
  const auto record = placeholder_record(effective_body(body), is_reply, attachments);
  usage_estimate estimate;
  estimate.used = model::serialized_size(record);
  estimate.over_limit = estimate.used > estimate.limit;
  return estimate;
}

}// namespace courier::lifecycle
