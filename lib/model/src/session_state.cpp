#include <model/session_state.hpp>

#include <algorithm>
#include <core/id_generator.hpp>
#include <fmt/format.h>

namespace courier::model {

auto session_state::find_contact(std::uint64_t id) -> contact *
{
  auto found = contacts.find(id);
  return found == contacts.end() ? nullptr : &found->second;
}

auto session_state::find_contact(std::uint64_t id) const -> const contact *
{
  auto found = contacts.find(id);
  return found == contacts.end() ? nullptr : &found->second;
}

auto session_state::find_contact(std::string_view name) -> contact *
{
  for (auto &[id, entry] : contacts) {
    if (entry.name == name) { return &entry; }
  }
  return nullptr;
}

auto session_state::find_inbound(std::uint64_t id) -> inbound_message *
{
  auto found = std::ranges::find_if(inbox, [id](const inbound_message &msg) { return msg.id == id; });
  return found == inbox.end() ? nullptr : &*found;
}

auto session_state::find_outbound(std::uint64_t id) -> outbound_message *
{
  auto found = std::ranges::find_if(outbox, [id](const outbound_message &msg) { return msg.id == id; });
  return found == outbox.end() ? nullptr : &*found;
}

auto session_state::find_contact_by_tag(std::uint64_t tag) -> contact *
{
  for (auto &[id, entry] : contacts) {
    if (entry.issued_credential and entry.issued_credential->tag_value() == tag) { return &entry; }
  }
  return nullptr;
}

auto session_state::contact_name(std::uint64_t id) const -> std::string
{
  const auto *entry = find_contact(id);
  return entry == nullptr ? fmt::format("<unknown {:016x}>", id) : entry->name;
}

auto session_state::fresh_contact_id() const -> std::uint64_t
{
  return core::id_generator::fresh_id([this](std::uint64_t id) { return contacts.contains(id); });
}

auto session_state::fresh_message_id() const -> std::uint64_t
{
  return core::id_generator::fresh_id([this](std::uint64_t id) {
    return std::ranges::any_of(inbox, [id](const inbound_message &msg) { return msg.id == id; })
           or std::ranges::any_of(outbox, [id](const outbound_message &msg) { return msg.id == id; });
  });
}

}// namespace courier::model
