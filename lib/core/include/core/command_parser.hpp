#pragma once

#include <charconv>
#include <core/events.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace courier::core {

/**
 * @brief Chain of Responsibility command parser.
 *
 * Parses raw command strings into strongly-typed command events. Arguments that are
 * missing or malformed leave the corresponding fields empty (or zero for message ids)
 * so the command handler can print usage. Uses unknown_command as fallback when no
 * command matches. Tracks chat mode, in which plain text is sent to one contact.
 */
class command_parser
{
public:
  using command_variant_t = std::variant<events::help,
    events::create_contact,
    events::accept_file,
    events::compose,
    events::send_file,
    events::reply,
    events::ack_inbound,
    events::open_inbound,
    events::show_contact,
    events::show_outbound,
    events::list_contacts,
    events::list_inbox,
    events::list_outbox,
    events::show_identity,
    events::estimate_usage,
    events::fetch_now,
    events::shutdown,
    events::chat,
    events::leave,
    events::unknown_command>;

  using parse_result_t = std::optional<command_variant_t>;
  using handler_t = std::function<parse_result_t(const std::string &)>;

  command_parser() { build_handler_chain(); }

  /**
   * @brief Parses a raw command string into a typed command event.
   *
   * In chat mode, input not starting with / becomes a message to the chat contact.
   */
  [[nodiscard]] auto parse(const std::string &input) -> command_variant_t
  {
    if (chat_contact_ and not input.starts_with("/")) {
      return events::compose{ .contact = *chat_contact_, .body = input, .attachments = {} };
    }

    for (const auto &handler : handlers_) {
      // cppcheck-suppress useStlAlgorithm
      if (auto result = handler(input)) { return *result; }
    }

    return events::unknown_command{ .input = input };
  }

  [[nodiscard]] auto in_chat_mode() const -> bool { return chat_contact_.has_value(); }

  [[nodiscard]] auto chat_contact() const -> const std::optional<std::string> & { return chat_contact_; }

  /// Message ids are shown as 16 hex digits; zero means the argument did not parse.
  [[nodiscard]] static auto parse_id(std::string_view text) -> std::uint64_t
  {
    std::uint64_t value = 0;
    static constexpr int hex_base = 16;
    const auto *end = text.data() + text.size();// NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    const auto [ptr, error] = std::from_chars(text.data(), end, value, hex_base);
    if (error != std::errc{} or ptr != end) { return 0; }
    return value;
  }

  /// Splits off the first word; the remainder keeps its inner spacing.
  [[nodiscard]] static auto split_first(const std::string &args) -> std::pair<std::string, std::string>
  {
    const auto space = args.find(' ');
    if (space == std::string::npos) { return { args, {} }; }
    return { args.substr(0, space), args.substr(space + 1) };
  }

private:
  std::optional<std::string> chat_contact_;
  std::vector<handler_t> handlers_;

  /**
   * @brief Creates a handler for exact command matches (no arguments).
   */
  template<typename Event> static auto exact_match(std::string_view command) -> handler_t
  {
    return [cmd = std::string(command)](const std::string &input) -> parse_result_t {
      if (input == cmd) { return Event{}; }
      return std::nullopt;
    };
  }

  /**
   * @brief Creates a handler for commands taking arguments after a prefix.
   *
   * The bare command without arguments also matches, with an empty argument string.
   */
  template<typename Extractor> static auto prefix_match(std::string_view command, Extractor extractor) -> handler_t
  {
    return [cmd = std::string(command), ext = std::move(extractor)](const std::string &input) -> parse_result_t {
      if (input == cmd) { return ext(std::string{}); }
      const auto prefix = cmd + " ";
      if (input.starts_with(prefix)) { return ext(input.substr(prefix.length())); }
      return std::nullopt;
    };
  }

  auto build_handler_chain() -> void
  {
    // Handlers ordered by expected frequency of use (most common first)

    handlers_.push_back(prefix_match("/send", [](const std::string &args) {
      auto [contact, body] = split_first(args);
      return events::compose{ .contact = std::move(contact), .body = std::move(body), .attachments = {} };
    }));
    handlers_.push_back(prefix_match("/reply", [](const std::string &args) {
      auto [id, body] = split_first(args);
      return events::reply{ .inbound_id = parse_id(id), .body = std::move(body) };
    }));
    handlers_.push_back(exact_match<events::list_inbox>("/inbox"));
    handlers_.push_back(prefix_match(
      "/open", [](const std::string &args) { return events::open_inbound{ .inbound_id = parse_id(args) }; }));
    handlers_.push_back(prefix_match(
      "/ack", [](const std::string &args) { return events::ack_inbound{ .inbound_id = parse_id(args) }; }));

    // Chat mode
    handlers_.push_back([this](const std::string &input) -> parse_result_t {
      constexpr std::string_view chat_cmd = "/chat ";
      if (not input.starts_with(chat_cmd)) { return std::nullopt; }
      const auto contact = input.substr(chat_cmd.length());
      if (not contact.empty()) { chat_contact_ = contact; }
      return events::chat{ .contact = contact };
    });
    handlers_.push_back([this](const std::string &input) -> parse_result_t {
      if (input != "/leave") { return std::nullopt; }
      chat_contact_.reset();
      return events::leave{};
    });

    handlers_.push_back(exact_match<events::list_outbox>("/outbox"));
    handlers_.push_back(prefix_match(
      "/outbox", [](const std::string &args) { return events::show_outbound{ .outbound_id = parse_id(args) }; }));
    handlers_.push_back(exact_match<events::list_contacts>("/contacts"));
    handlers_.push_back(exact_match<events::fetch_now>("/fetch"));
    handlers_.push_back(exact_match<events::help>("/help"));

    // Contact management
    handlers_.push_back(
      prefix_match("/new", [](const std::string &args) { return events::create_contact{ .name = args }; }));
    handlers_.push_back(prefix_match("/accept", [](const std::string &args) {
      auto [contact, path] = split_first(args);
      return events::accept_file{ .contact = std::move(contact), .path = std::move(path) };
    }));
    handlers_.push_back(
      prefix_match("/show", [](const std::string &args) { return events::show_contact{ .name = args }; }));

    // Less frequent commands
    handlers_.push_back(prefix_match("/sendfile", [](const std::string &args) {
      auto [contact, rest] = split_first(args);
      auto [path, body] = split_first(rest);
      return events::send_file{ .contact = std::move(contact), .path = std::move(path), .body = std::move(body) };
    }));
    handlers_.push_back(prefix_match("/usage", [](const std::string &args) {
      constexpr std::string_view reply_flag = "-r ";
      if (args.starts_with(reply_flag)) {
        return events::estimate_usage{ .body = args.substr(reply_flag.length()), .is_reply = true, .attachments = {} };
      }
      return events::estimate_usage{ .body = args, .is_reply = false, .attachments = {} };
    }));
    handlers_.push_back(exact_match<events::show_identity>("/identity"));
    handlers_.push_back(exact_match<events::shutdown>("/quit"));
  }
};

}// namespace courier::core
