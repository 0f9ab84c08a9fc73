#pragma once

#include <async/async_queue.hpp>
#include <concepts>
#include <core/command_parser.hpp>
#include <core/events.hpp>
#include <cstdint>
#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace courier::core {

/**
 * @brief Turns typed input lines into coordinator commands.
 *
 * Reads the files named by /accept and /sendfile so the session owner never touches
 * the filesystem, validates arguments and prints usage, and answers help and chat
 * mode locally. Everything else is forwarded to the session queue.
 */
struct command_handler
{
  // Type traits for standard_processor
  using in_queue_t = async::async_queue<events::raw_command>;

  struct out_queues_t
  {
    std::shared_ptr<async::async_queue<events::display_message>> display;
    std::shared_ptr<async::async_queue<events::session_coordinator::in_t>> session;
  };

  explicit command_handler(const out_queues_t &queues)
    : display_out_queue_(queues.display), session_out_queue_(queues.session)
  {}

  auto handle(const events::raw_command &command) -> void
  {
    std::visit([this](const auto &cmd) { handle_impl(cmd); }, parser_.parse(command.input));
  }

  [[nodiscard]] auto parser() const -> const command_parser & { return parser_; }

  static constexpr auto help_text =
    "Commands:\n"
    "  /new <name>                    Create a contact and print its key exchange\n"
    "  /accept <name> <file>          Apply the key exchange the contact sent you\n"
    "  /send <name> <message>         Send a message\n"
    "  /sendfile <name> <file> [msg]  Send a file as an attachment\n"
    "  /chat <name>                   Send plain input to this contact until /leave\n"
    "  /leave                         Leave chat mode\n"
    "  /inbox                         List received messages\n"
    "  /open <id>                     Show a received message\n"
    "  /reply <id> <message>          Reply to a received message\n"
    "  /ack <id>                      Acknowledge a received message\n"
    "  /outbox [id]                   List sent messages or show one\n"
    "  /contacts                      List contacts\n"
    "  /show <name>                   Show a contact\n"
    "  /identity                      Show your server and identity\n"
    "  /usage [-r] <message>          Show how much of the size limit a message uses\n"
    "  /fetch                         Deliver and fetch messages now\n"
    "  /help                          Show this list\n"
    "  /quit                          Save and exit\n";

private:
  template<typename... Args> auto emit(fmt::format_string<Args...> format_string, Args &&...args) const -> void
  {
    display_out_queue_->push(events::display_message{ fmt::format(format_string, std::forward<Args>(args)...) });
  }

  auto forward(events::session_coordinator::in_t command) const -> void
  {
    if (not session_out_queue_->try_push(std::move(command))) { emit("Session is shutting down\n"); }
  }

  static auto read_file(const std::string &path) -> std::optional<std::vector<std::uint8_t>>
  {
    std::ifstream input(path, std::ios::binary);
    if (not input) { return std::nullopt; }
    return std::vector<std::uint8_t>{ std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>() };
  }

  auto handle_impl(const events::help & /*command*/) const -> void { emit("{}", help_text); }

  auto handle_impl(const events::unknown_command &command) const -> void
  {
    emit("Unknown command: {} (type /help for commands)\n", command.input);
  }

  auto handle_impl(const events::chat &command) const -> void
  {
    if (command.contact.empty()) {
      emit("Usage: /chat <name>\n");
      return;
    }
    emit("Chatting with {}; /leave to stop\n", command.contact);
  }

  auto handle_impl(const events::leave & /*command*/) const -> void { emit("Left chat mode\n"); }

  auto handle_impl(const events::create_contact &command) const -> void
  {
    if (command.name.empty() or command.name.find(' ') != std::string::npos) {
      emit("Usage: /new <name>\n");
      return;
    }
    forward(command);
  }

  auto handle_impl(const events::accept_file &command) const -> void
  {
    if (command.contact.empty() or command.path.empty()) {
      emit("Usage: /accept <name> <file>\n");
      return;
    }
    const auto contents = read_file(command.path);
    if (not contents) {
      emit("Cannot read {}\n", command.path);
      return;
    }
    forward(events::apply_handshake{
      .contact = command.contact, .armored = std::string(contents->begin(), contents->end()) });
  }

  auto handle_impl(const events::compose &command) const -> void
  {
    if (command.contact.empty() or command.body.empty()) {
      emit("Usage: /send <name> <message>\n");
      return;
    }
    forward(command);
  }

  auto handle_impl(const events::send_file &command) const -> void
  {
    if (command.contact.empty() or command.path.empty()) {
      emit("Usage: /sendfile <name> <file> [message]\n");
      return;
    }
    auto contents = read_file(command.path);
    if (not contents) {
      emit("Cannot read {}\n", command.path);
      return;
    }
    std::vector<events::attachment> attachments;
    attachments.push_back(events::attachment{
      .filename = std::filesystem::path(command.path).filename().string(), .contents = std::move(*contents) });
    forward(
      events::compose{ .contact = command.contact, .body = command.body, .attachments = std::move(attachments) });
  }

  auto handle_impl(const events::reply &command) const -> void
  {
    if (command.inbound_id == 0 or command.body.empty()) {
      emit("Usage: /reply <id> <message>\n");
      return;
    }
    forward(command);
  }

  auto handle_impl(const events::ack_inbound &command) const -> void
  {
    if (command.inbound_id == 0) {
      emit("Usage: /ack <id>\n");
      return;
    }
    forward(command);
  }

  auto handle_impl(const events::open_inbound &command) const -> void
  {
    if (command.inbound_id == 0) {
      emit("Usage: /open <id>\n");
      return;
    }
    forward(command);
  }

  auto handle_impl(const events::show_contact &command) const -> void
  {
    if (command.name.empty()) {
      emit("Usage: /show <name>\n");
      return;
    }
    forward(command);
  }

  auto handle_impl(const events::show_outbound &command) const -> void
  {
    if (command.outbound_id == 0) {
      emit("Usage: /outbox [id]\n");
      return;
    }
    forward(command);
  }

  template<typename T>
    requires(std::same_as<T, events::list_contacts> or std::same_as<T, events::list_inbox>
             or std::same_as<T, events::list_outbox> or std::same_as<T, events::show_identity>
             or std::same_as<T, events::estimate_usage> or std::same_as<T, events::fetch_now>
             or std::same_as<T, events::shutdown>)
  auto handle_impl(const T &command) const -> void
  {
    forward(command);
  }

  command_parser parser_;
  std::shared_ptr<async::async_queue<events::display_message>> display_out_queue_;
  std::shared_ptr<async::async_queue<events::session_coordinator::in_t>> session_out_queue_;
};

}// namespace courier::core
