#pragma once

#include <array>
#include <async/async_queue.hpp>
#include <atomic>
#include <chrono>
#include <core/events.hpp>
#include <memory>
#include <replxx.hxx>
#include <string>
#include <string_view>
#include <thread>

namespace courier::tui {

/**
 * @brief Line-oriented front end with REPL.
 *
 * Reads commands with Replxx (history, completion) on the calling thread and pushes
 * them as raw_command events. A poller thread prints display messages as they arrive.
 * Ending input (Ctrl-D) or /quit requests a shutdown and returns from run(); output
 * that arrives later is left in the display queue for the caller.
 */
struct processor
{
  /**
   * @param history_path File used to load and save input history
   * @param command_queue Queue for outgoing user commands
   * @param display_queue Queue for incoming display messages
   */
  processor(std::string history_path,
    const std::shared_ptr<async::async_queue<core::events::raw_command>> &command_queue,
    const std::shared_ptr<async::async_queue<core::events::display_message>> &display_queue)
    : history_path_(std::move(history_path)), command_queue_(command_queue), display_queue_(display_queue)
  {}

  ~processor() { stop(); }

  processor(const processor &) = delete;
  auto operator=(const processor &) -> processor & = delete;
  processor(processor &&) = delete;
  auto operator=(processor &&) -> processor & = delete;

  /**
   * @brief Runs the interactive loop until the user quits.
   */
  auto run() -> void
  {
    setup_replxx();
    running_.store(true);

    message_poller_ = std::thread([this] {
      while (running_.load()) {
        while (auto msg = display_queue_->try_pop()) { print_message(msg->message); }
        std::this_thread::sleep_for(std::chrono::milliseconds(message_poll_interval_ms));
      }
    });

    while (running_.load()) {
      const char *input = rx_.input(prompt_);
      if (input == nullptr) {
        submit("/quit");
        break;
      }

      auto command = trim(input);
      if (command.empty()) { continue; }

      rx_.history_add(command);
      submit(command);
      if (command == "/quit") { break; }
    }

    stop();
    save_history();
  }

  /**
   * @brief Stops the display poller, printing whatever is still queued.
   */
  auto stop() -> void
  {
    running_.store(false);
    if (message_poller_.joinable()) {
      message_poller_.join();
      while (auto msg = display_queue_->try_pop()) { print_message(msg->message); }
    }
  }

  [[nodiscard]] static auto trim(std::string_view input) -> std::string
  {
    constexpr std::string_view whitespace = " \t\r\n";
    const auto first = input.find_first_not_of(whitespace);
    if (first == std::string_view::npos) { return {}; }
    const auto last = input.find_last_not_of(whitespace);
    return std::string(input.substr(first, last - first + 1));
  }

  static constexpr std::array<std::string_view, 18> commands = { "/accept",
    "/ack",
    "/chat",
    "/contacts",
    "/fetch",
    "/help",
    "/identity",
    "/inbox",
    "/leave",
    "/new",
    "/open",
    "/outbox",
    "/quit",
    "/reply",
    "/send",
    "/sendfile",
    "/show",
    "/usage" };

private:
  auto setup_replxx() -> void
  {
    prompt_ = std::string(GREEN) + "courier> " + RESET;

    rx_.history_load(history_path_);
    rx_.set_max_history_size(MAX_HISTORY_SIZE);
    rx_.set_max_hint_rows(MAX_HINT_ROWS);

    rx_.set_completion_callback([](const std::string &input, int & /*context*/) {
      replxx::Replxx::completions_t completions;
      for (const auto command : commands) {
        if (command.starts_with(input)) { completions.emplace_back(std::string(command)); }
      }
      return completions;
    });
  }

  auto print_message(const std::string &message) -> void
  {
    auto msg = message;
    if (not msg.empty() and msg.back() == '\n') { msg.pop_back(); }
    auto formatted = msg + "\n";
    rx_.write(formatted.c_str(), static_cast<int>(formatted.size()));
  }

  auto submit(const std::string &input) -> void
  {
    if (not command_queue_->try_push(core::events::raw_command{ .input = input })) {
      print_message("Session has stopped");
      running_.store(false);
    }
  }

  auto save_history() -> void { rx_.history_save(history_path_); }

  static constexpr const char *GREEN = "\033[32m";
  static constexpr const char *RESET = "\033[0m";
  static constexpr auto message_poll_interval_ms = 16;
  static constexpr auto MAX_HISTORY_SIZE = 1000;
  static constexpr auto MAX_HINT_ROWS = 3;

  std::string history_path_;
  std::shared_ptr<async::async_queue<core::events::raw_command>> command_queue_;
  std::shared_ptr<async::async_queue<core::events::display_message>> display_queue_;

  std::atomic<bool> running_{ false };
  std::thread message_poller_;
  replxx::Replxx rx_;
  std::string prompt_;
};

}// namespace courier::tui
