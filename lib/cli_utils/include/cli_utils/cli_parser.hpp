#pragma once

#include <CLI/CLI.hpp>
#include <cstdlib>
#include <handshake/server_address.hpp>
#include <platform/env_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace courier::cli_utils {

struct cli_args
{
  std::string state_path;///< Defaults to <data directory>/state
  std::string spool_dir;///< Defaults to <temp directory>/courier-spool
  std::string server;///< Home server for a new account
  bool testing = false;///< Accept non-onion server hosts
  unsigned fetch_interval = 0;///< Seconds between automatic transactions, 0 for manual only
  bool verbose = false;
  bool show_version = false;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("-s,--state", args.state_path, "Path to the encrypted state file");
  app.add_option("--spool", args.spool_dir, "Shared spool directory standing in for the delivery server");
  app.add_option("--server", args.server, "Home server address for a new account (courier://KEY@host:port)");
  app.add_flag("--testing", args.testing, "Allow server hosts that are not onion addresses");
  app.add_option("--fetch-interval", args.fetch_interval, "Seconds between automatic fetches (0 disables)")
    ->check(CLI::NonNegativeNumber);
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");
}

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "courier - store-and-forward secure messaging", "courier" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  if (args.state_path.empty()) { args.state_path = platform::get_data_directory() + "/state"; }
  if (args.spool_dir.empty()) { args.spool_dir = platform::get_temp_directory() + "/courier-spool"; }
  args.state_path = platform::expand_tilde_path(args.state_path);
  args.spool_dir = platform::expand_tilde_path(args.spool_dir);

  return args;
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (not args.server.empty() and not handshake::parse_server(args.server, args.testing)) {
    spdlog::error("Invalid server address: {}", args.server);
    return false;
  }
  return true;
}

}// namespace courier::cli_utils
