#include <algorithm>
#include <async/async_queue.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <chrono>
#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <coordinator/session_coordinator.hpp>
#include <core/command_handler.hpp>
#include <core/events.hpp>
#include <core/presentation_handler.hpp>
#include <core/processor_runner.hpp>
#include <core/standard_processor.hpp>
#include <filesystem>
#include <fmt/core.h>
#include <lifecycle/ratchet_sealer.hpp>
#include <memory>
#include <network/network_actor.hpp>
#include <network/spool_transport.hpp>
#include <optional>
#include <persistence/state_writer.hpp>
#include <platform/terminal.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <thread>
#include <tuple>
#include <tui/processor.hpp>
#include <vector>

namespace courier {

namespace {

  /// Cancellation signal for one actor, emitted on the io_context the actor runs on.
  struct actor_cancel
  {
    std::shared_ptr<boost::asio::io_context> io_context;
    std::shared_ptr<boost::asio::cancellation_signal> signal = std::make_shared<boost::asio::cancellation_signal>();
    std::shared_ptr<boost::asio::cancellation_slot> slot =
      std::make_shared<boost::asio::cancellation_slot>(signal->slot());

    auto cancel() const -> void
    {
      boost::asio::post(*io_context, [sig = signal] { sig->emit(boost::asio::cancellation_type::all); });
    }
  };

  /// An io_context and the thread running it.
  struct actor_thread
  {
    std::string name;
    std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
    std::thread thread;

    auto start() -> void
    {
      thread = std::thread([this] {
        spdlog::debug("[{}] io_context thread started", name);
        io_context->run();
        spdlog::debug("[{}] io_context thread stopped", name);
      });
    }

    auto stop() -> void
    {
      io_context->stop();
      if (thread.joinable()) { thread.join(); }
    }
  };

  auto wait_for(const std::vector<std::shared_ptr<core::coroutine_state>> &states, std::chrono::seconds timeout)
    -> bool
  {
    const auto start = std::chrono::steady_clock::now();
    constexpr auto poll_interval = std::chrono::milliseconds(10);
    while (not std::ranges::all_of(states, [](const auto &state) { return state->finished(); })) {
      if (std::chrono::steady_clock::now() - start > timeout) { return false; }
      std::this_thread::sleep_for(poll_interval);
    }
    return true;
  }

}// namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  using sealer_t = lifecycle::ratchet_sealer;
  using coordinator_t = coordinator::session_coordinator<sealer_t>;
  using network_t = network::network_actor<network::spool_transport>;
  using cmd_processor_t = core::standard_processor<core::command_handler>;
  using presentation_processor_t = core::standard_processor<core::presentation_handler>;

  auto args = cli_utils::parse_cli_args(argc, argv);
  if (args.show_version) {
    cli_utils::print_version();
    return 0;
  }
  if (not cli_utils::validate_cli_args(args)) { return 1; }
  cli_utils::configure_logging(args);

  std::optional<cli_utils::unlocked_session> session;
  try {
    session = cli_utils::open_session(args, platform::read_secret);
  } catch (const std::system_error &e) {
    spdlog::error("Cannot open {}: {}", args.state_path, e.code().message());
    return 1;
  } catch (const std::filesystem::filesystem_error &e) {
    spdlog::error("Cannot open {}: {}", args.state_path, e.what());
    return 1;
  }
  if (not session) { return 1; }

  cli_utils::print_app_banner(session->state.self, args.state_path);

  actor_thread session_thread{ .name = "session" };
  actor_thread network_thread{ .name = "network" };
  actor_thread persistence_thread{ .name = "persistence" };

  auto display_queue = std::make_shared<async::async_queue<core::events::display_message>>(session_thread.io_context);
  auto command_queue = std::make_shared<async::async_queue<core::events::raw_command>>(session_thread.io_context);
  auto session_queue =
    std::make_shared<async::async_queue<core::events::session_coordinator::in_t>>(session_thread.io_context);
  auto presentation_queue =
    std::make_shared<async::async_queue<core::events::presentation_event_variant_t>>(session_thread.io_context);
  auto persistence_done_queue =
    std::make_shared<async::async_queue<core::events::persistence::out_t>>(session_thread.io_context);
  auto network_queue = std::make_shared<async::async_queue<core::events::network::in_t>>(network_thread.io_context);
  auto persistence_queue =
    std::make_shared<async::async_queue<core::events::persistence::in_t>>(persistence_thread.io_context);

  cli_utils::configure_logging(args, display_queue);

  const auto own_identity = session->state.self.identity_public;
  auto outgoing = session->state.queue;

  auto writer = std::make_shared<persistence::state_writer>(
    persistence_queue, persistence_done_queue, args.state_path, session->key, session->salt);

  std::shared_ptr<network::spool_transport> transport;
  try {
    transport = std::make_shared<network::spool_transport>(args.spool_dir, own_identity);
  } catch (const std::filesystem::filesystem_error &e) {
    spdlog::error("Cannot use spool directory {}: {}", args.spool_dir, e.what());
    return 1;
  }
  auto network = std::make_shared<network_t>(transport,
    network_thread.io_context,
    network_queue,
    outgoing,
    session_queue,
    std::chrono::seconds(args.fetch_interval));

  auto coordinator = std::make_shared<coordinator_t>(std::move(session->state),
    std::make_shared<sealer_t>(),
    coordinator_t::queues_t{ .in = session_queue,
      .persistence = persistence_queue,
      .persistence_done = persistence_done_queue,
      .network = network_queue,
      .presentation = presentation_queue },
    handshake::apply_options{ .allow_any_host = args.testing });

  auto cmd_processor = std::make_shared<cmd_processor_t>(session_thread.io_context,
    command_queue,
    core::command_handler::out_queues_t{ .display = display_queue, .session = session_queue });
  auto presentation_processor = std::make_shared<presentation_processor_t>(session_thread.io_context,
    presentation_queue,
    core::presentation_handler::out_queues_t{ .display = display_queue });

  // A slot holds one handler at a time, so every actor gets its own signal.
  const actor_cancel coordinator_cancel{ .io_context = session_thread.io_context };
  const actor_cancel command_cancel{ .io_context = session_thread.io_context };
  const actor_cancel presentation_cancel{ .io_context = session_thread.io_context };
  const actor_cancel network_cancel{ .io_context = network_thread.io_context };
  const actor_cancel writer_cancel{ .io_context = persistence_thread.io_context };

  auto session_guard = boost::asio::make_work_guard(*session_thread.io_context);
  auto network_guard = boost::asio::make_work_guard(*network_thread.io_context);
  auto persistence_guard = boost::asio::make_work_guard(*persistence_thread.io_context);

  auto coordinator_state =
    core::spawn_processor(session_thread.io_context, coordinator, coordinator_cancel.slot, "session_coordinator");
  auto cmd_state =
    core::spawn_processor(session_thread.io_context, cmd_processor, command_cancel.slot, "command_processor");
  auto presentation_state = core::spawn_processor(
    session_thread.io_context, presentation_processor, presentation_cancel.slot, "presentation_processor");
  auto network_state = core::spawn_processor(network_thread.io_context, network, network_cancel.slot, "network");
  auto writer_state = core::spawn_processor(persistence_thread.io_context, writer, writer_cancel.slot, "state_writer");

  session_thread.start();
  network_thread.start();
  persistence_thread.start();

  std::ignore = network_queue->try_push(core::events::network::trigger{});

  {
    tui::processor tui_processor(args.state_path + ".history", command_queue, display_queue);
    tui_processor.run();
  }

  spdlog::debug("TUI exited, waiting for the session to shut down...");
  constexpr auto shutdown_timeout = std::chrono::seconds(10);
  if (not wait_for({ coordinator_state }, shutdown_timeout)) {
    spdlog::warn("Timeout waiting for the session to shut down");
    coordinator_cancel.cancel();
  }

  network_cancel.cancel();
  writer_cancel.cancel();
  command_cancel.cancel();
  presentation_cancel.cancel();
  command_queue->close();
  presentation_queue->close();

  constexpr auto actor_timeout = std::chrono::seconds(2);
  if (not wait_for({ cmd_state, presentation_state, network_state, writer_state }, actor_timeout)) {
    spdlog::warn("Timeout waiting for actors to complete, forcing shutdown");
  }

  session_guard.reset();
  network_guard.reset();
  persistence_guard.reset();
  session_thread.stop();
  network_thread.stop();
  persistence_thread.stop();

  while (auto msg = display_queue->try_pop()) {
    fmt::print("{}", msg->message);
    if (not msg->message.ends_with('\n')) { fmt::print("\n"); }
  }
  return 0;
}

}// namespace courier

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int { return courier::main(argc, argv); }
