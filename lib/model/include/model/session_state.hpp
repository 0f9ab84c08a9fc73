#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <model/contact.hpp>
#include <model/identity.hpp>
#include <model/message_queue.hpp>
#include <model/messages.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace courier::model {

/**
 * @brief Everything the session owner knows. Only the queue is shared with another actor.
 */
struct session_state
{
  identity self;
  std::map<std::uint64_t, contact> contacts;
  std::vector<inbound_message> inbox;
  std::vector<outbound_message> outbox;
  std::shared_ptr<message_queue> queue{ std::make_shared<message_queue>() };

  [[nodiscard]] auto find_contact(std::uint64_t id) -> contact *;
  [[nodiscard]] auto find_contact(std::uint64_t id) const -> const contact *;
  [[nodiscard]] auto find_contact(std::string_view name) -> contact *;
  [[nodiscard]] auto find_inbound(std::uint64_t id) -> inbound_message *;
  [[nodiscard]] auto find_outbound(std::uint64_t id) -> outbound_message *;

  /// Contact that was issued the credential carrying this tag.
  [[nodiscard]] auto find_contact_by_tag(std::uint64_t tag) -> contact *;

  /// Display name for a contact id, or a placeholder for an unknown id.
  [[nodiscard]] auto contact_name(std::uint64_t id) const -> std::string;

  /// Fresh non-zero id not used by any contact.
  [[nodiscard]] auto fresh_contact_id() const -> std::uint64_t;

  /// Fresh non-zero id not used by any inbound or outbound message.
  [[nodiscard]] auto fresh_message_id() const -> std::uint64_t;
};

}// namespace courier::model
