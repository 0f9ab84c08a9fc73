#include <async/async_queue.hpp>
#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/errors.hpp>
#include <core/events.hpp>
#include <deque>
#include <filesystem>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

#include "test_doubles/session_fixture.hpp"
#include "test_doubles/temp_directory.hpp"
#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <cli_utils/tui_sink.hpp>
#include <persistence/state_file.hpp>

namespace {

/// Answers prompts from a script; nullopt once the script runs out.
struct scripted_prompt
{
  std::deque<std::string> answers;
  std::vector<std::string> asked;

  auto operator()(std::string_view question) -> std::optional<std::string>
  {
    asked.emplace_back(question);
    if (answers.empty()) { return std::nullopt; }
    auto answer = answers.front();
    answers.pop_front();
    return answer;
  }
};

auto prompt_from(scripted_prompt &script) -> courier::cli_utils::passphrase_prompt_t
{
  return [&script](std::string_view question) { return script(question); };
}

}// namespace

TEST_CASE("cli_args default values", "[cli_utils][cli_parser]")
{
  const courier::cli_utils::cli_args args;

  REQUIRE(args.state_path.empty());
  REQUIRE(args.server.empty());
  REQUIRE(args.testing == false);
  REQUIRE(args.fetch_interval == 0);
  REQUIRE(args.verbose == false);
  REQUIRE(args.show_version == false);
}

TEST_CASE("setup_cli_app parses the command line", "[cli_utils][cli_parser]")
{
  courier::cli_utils::cli_args args;
  CLI::App app;
  courier::cli_utils::setup_cli_app(app, args);

  SECTION("all options")
  {
    app.parse("--verbose --fetch-interval 30 --testing --spool /tmp/spool -s /tmp/state", false);
    CHECK(args.state_path == "/tmp/state");
    CHECK(args.spool_dir == "/tmp/spool");
    CHECK(args.fetch_interval == 30);
    CHECK(args.testing);
    CHECK(args.verbose);
  }

  SECTION("a negative interval is rejected")
  {
    CHECK_THROWS_AS(app.parse("--fetch-interval -5", false), CLI::ParseError);
  }
}

TEST_CASE("validate_cli_args checks the server address", "[cli_utils][cli_parser]")
{
  courier::cli_utils::cli_args args;

  SECTION("no server is fine") { REQUIRE(courier::cli_utils::validate_cli_args(args)); }

  SECTION("a malformed server fails")
  {
    args.server = "not a server";
    REQUIRE_FALSE(courier::cli_utils::validate_cli_args(args));
  }

  SECTION("a clearnet host needs testing mode")
  {
    args.server = courier_test::test_server("relay.example");
    REQUIRE_FALSE(courier::cli_utils::validate_cli_args(args));
    args.testing = true;
    REQUIRE(courier::cli_utils::validate_cli_args(args));
  }
}

SCENARIO("Sessions are created and unlocked from the state file", "[cli_utils][session]")
{
  GIVEN("No state file yet")
  {
    courier_test::temp_directory dir;
    courier::cli_utils::cli_args args;
    args.state_path = (dir.path / "nested" / "state").string();
    args.testing = true;

    WHEN("no server is given")
    {
      scripted_prompt script;
      const auto session = courier::cli_utils::open_session(args, prompt_from(script));

      THEN("nothing is created") { REQUIRE_FALSE(session.has_value()); }
    }

    WHEN("an account is created without a passphrase")
    {
      args.server = courier_test::test_server("relay.example");
      scripted_prompt script{ .answers = { "a", "b", "", "" } };
      const auto session = courier::cli_utils::open_session(args, prompt_from(script));

      THEN("the mismatch is asked again and the file opens without prompting")
      {
        REQUIRE(session.has_value());
        REQUIRE(session->created);
        REQUIRE(session->key == courier::crypto::key32{});
        REQUIRE(script.asked.size() == 4);
        REQUIRE(std::filesystem::exists(args.state_path));

        scripted_prompt silent;
        const auto reopened = courier::cli_utils::open_session(args, prompt_from(silent));
        REQUIRE(reopened.has_value());
        REQUIRE_FALSE(reopened->created);
        REQUIRE(reopened->state.self == session->state.self);
        REQUIRE(silent.asked.empty());
      }
    }

    WHEN("an account is created with a passphrase")
    {
      args.server = courier_test::test_server("relay.example");
      scripted_prompt script{ .answers = { "secret", "secret" } };
      const auto session = courier::cli_utils::open_session(args, prompt_from(script));
      REQUIRE(session.has_value());

      THEN("a wrong passphrase is asked again until the right one is given")
      {
        scripted_prompt retry{ .answers = { "wrong", "secret" } };
        const auto reopened = courier::cli_utils::unlock_session(args.state_path, prompt_from(retry));
        REQUIRE(reopened.has_value());
        REQUIRE(reopened->state.self == session->state.self);
        REQUIRE(retry.asked.size() == 2);
      }

      THEN("giving up returns nothing")
      {
        scripted_prompt none;
        REQUIRE_FALSE(courier::cli_utils::unlock_session(args.state_path, prompt_from(none)).has_value());
      }
    }
  }

  GIVEN("A damaged state file")
  {
    courier_test::temp_directory dir;
    const auto path = dir.path / "state";
    courier::persistence::write_file_atomic(path, courier::crypto::bytes(8, 0x00));

    THEN("unlocking reports corrupt state")
    {
      scripted_prompt script;
      try {
        std::ignore = courier::cli_utils::unlock_session(path, prompt_from(script));
        FAIL("expected corrupt_state");
      } catch (const std::system_error &e) {
        REQUIRE(e.code() == courier::core::errc::corrupt_state);
      }
    }
  }
}

TEST_CASE("tui_sink routes log lines to the display queue", "[cli_utils][tui_sink]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto display = std::make_shared<courier::async::async_queue<courier::core::events::display_message>>(io_context);
  auto sink = std::make_shared<courier::cli_utils::tui_sink_mutex_t>(display);
  sink->set_pattern("%v");
  spdlog::logger logger("tui_test", sink);

  logger.info("hello {}", "world");

  const auto msg = display->try_pop();
  REQUIRE(msg.has_value());
  CHECK(msg->message == "hello world");
}
