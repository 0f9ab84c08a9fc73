#pragma once

#include <async/async_queue.hpp>
#include <cli_utils/cli_parser.hpp>
#include <cli_utils/tui_sink.hpp>
#include <core/errors.hpp>
#include <core/events.hpp>
#include <crypto/bytes.hpp>
#include <crypto/random.hpp>
#include <filesystem>
#include <fmt/core.h>
#include <functional>
#include <memory>
#include <model/identity.hpp>
#include <model/session_state.hpp>
#include <optional>
#include <persistence/snapshot.hpp>
#include <persistence/state_file.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>

#include "internal_use_only/config.hpp"

namespace courier::cli_utils {

/// Asks the user for a passphrase; nullopt when input has ended.
using passphrase_prompt_t = std::function<std::optional<std::string>(std::string_view)>;

struct unlocked_session
{
  model::session_state state;
  crypto::key32 key{};
  crypto::bytes salt;
  bool created = false;///< A new account was written by this run
};

inline auto configure_logging(const cli_args &args,
  std::shared_ptr<async::async_queue<core::events::display_message>> display_queue = nullptr) -> void
{
  if (display_queue) {
    auto sink = std::make_shared<tui_sink_mutex_t>(std::move(display_queue));
    auto logger = std::make_shared<spdlog::logger>("tui_logger", sink);
    spdlog::set_default_logger(logger);
  }

  spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::cfg::load_env_levels();
}

inline auto print_version() -> void { fmt::print("courier v{}\n", courier::cmake::project_version); }

inline auto print_app_banner(const model::identity &self, const std::string &state_path) -> void
{
  fmt::print("courier v{} - Interactive Mode\n", courier::cmake::project_version);
  fmt::print("Server: {}\n", self.server);
  fmt::print("State:  {}\n", state_path);
  fmt::print("Type /help for available commands, /quit to exit\n\n");
}

/**
 * @brief Creates a new account and writes its first state file.
 */
inline auto create_session(const std::filesystem::path &path,
  const std::string &server,
  const passphrase_prompt_t &prompt) -> std::optional<unlocked_session>
{
  std::string passphrase;
  while (true) {
    auto first = prompt("New passphrase (empty for none): ");
    if (not first) { return std::nullopt; }
    auto second = prompt("Repeat passphrase: ");
    if (not second) { return std::nullopt; }
    if (*first == *second) {
      passphrase = std::move(*first);
      break;
    }
    fmt::print("Passphrases do not match\n");
  }

  unlocked_session session;
  session.state.self = model::identity::create(server);
  session.salt = crypto::random_bytes(persistence::salt_size);
  session.key = persistence::derive_key(passphrase, session.salt);
  session.created = true;

  if (path.has_parent_path()) { std::filesystem::create_directories(path.parent_path()); }
  persistence::write_file_atomic(
    path, persistence::seal_state(session.key, session.salt, persistence::serialize(session.state)));
  spdlog::info("Created new account in {}", path.string());
  return session;
}

/**
 * @brief Opens an existing state file, asking for the passphrase only when one is set.
 *
 * The empty passphrase is tried first. Prompts repeat while the passphrase is wrong.
 *
 * @throws std::system_error corrupt_state if the file is damaged
 * @throws std::filesystem::filesystem_error if the file cannot be read
 */
inline auto unlock_session(const std::filesystem::path &path, const passphrase_prompt_t &prompt)
  -> std::optional<unlocked_session>
{
  const auto file = persistence::read_file(path);

  unlocked_session session;
  session.salt = persistence::read_salt(file);

  std::string passphrase;
  while (true) {
    session.key = persistence::derive_key(passphrase, session.salt);
    bool wrong_passphrase = false;
    try {
      session.state = persistence::load(file, session.key);
    } catch (const std::system_error &e) {
      if (e.code() != core::errc::incorrect_passphrase) { throw; }
      wrong_passphrase = true;
    }
    if (not wrong_passphrase) { return session; }

    if (not passphrase.empty()) { fmt::print("Incorrect passphrase\n"); }
    auto answer = prompt("Passphrase: ");
    if (not answer) { return std::nullopt; }
    passphrase = std::move(*answer);
  }
}

/**
 * @brief Opens the state file at path, or creates a new account if there is none.
 *
 * @return nullopt if the user gave up, or no state exists and no server was given
 */
inline auto open_session(const cli_args &args, const passphrase_prompt_t &prompt) -> std::optional<unlocked_session>
{
  const std::filesystem::path path(args.state_path);
  if (std::filesystem::exists(path)) { return unlock_session(path, prompt); }

  if (args.server.empty()) {
    spdlog::error("No state file at {}; pass --server to create a new account", path.string());
    return std::nullopt;
  }
  return create_session(path, args.server, prompt);
}

}// namespace courier::cli_utils
