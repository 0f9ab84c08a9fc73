#include <async/async_queue.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/events.hpp>
#include <core/processor_runner.hpp>
#include <crypto/random.hpp>
#include <memory>
#include <persistence/snapshot.hpp>
#include <persistence/state_file.hpp>
#include <persistence/state_writer.hpp>
#include <tuple>
#include <utility>
#include <variant>

#include "test_doubles/session_fixture.hpp"
#include "test_doubles/temp_directory.hpp"

using namespace courier;
namespace events = core::events::persistence;

namespace {

struct writer_fixture
{
  courier_test::temp_directory dir;
  std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
  std::shared_ptr<persistence::state_writer::in_queue_t> in_queue =
    std::make_shared<persistence::state_writer::in_queue_t>(io_context);
  std::shared_ptr<persistence::state_writer::out_queue_t> out_queue =
    std::make_shared<persistence::state_writer::out_queue_t>(io_context);
  crypto::bytes salt;
  crypto::key32 key{};
  std::shared_ptr<persistence::state_writer> writer;

  explicit writer_fixture(const std::filesystem::path &relative = "state",
    crypto::bytes writer_salt = crypto::random_bytes(persistence::salt_size))
    : salt(std::move(writer_salt)),
      writer(std::make_shared<persistence::state_writer>(in_queue, out_queue, dir.path / relative, key, salt))
  {}
};

}// namespace

SCENARIO("The state writer persists snapshots and reports each write", "[persistence][state_writer]")
{
  GIVEN("A running writer")
  {
    writer_fixture fixture;
    auto state = core::spawn_processor(fixture.io_context, fixture.writer, nullptr, "state_writer");
    const auto session = courier_test::make_state("alice.example");

    WHEN("two snapshots are saved")
    {
      fixture.in_queue->push(events::save{ .snapshot = persistence::serialize(session), .sequence = 1 });
      auto later = courier_test::make_state("alice.example");
      fixture.in_queue->push(events::save{ .snapshot = persistence::serialize(later), .sequence = 2 });
      fixture.io_context->poll();

      THEN("both are acknowledged in order and the file holds the last one")
      {
        REQUIRE(std::get<events::written>(*fixture.out_queue->try_pop()).sequence == 1);
        REQUIRE(std::get<events::written>(*fixture.out_queue->try_pop()).sequence == 2);
        const auto reloaded = persistence::load(persistence::read_file(fixture.dir.path / "state"), fixture.key);
        REQUIRE(reloaded.self == later.self);
      }

      AND_WHEN("the input queue is closed")
      {
        fixture.in_queue->close();
        fixture.io_context->poll();

        THEN("the writer reports stopped and finishes")
        {
          std::ignore = fixture.out_queue->try_pop();
          std::ignore = fixture.out_queue->try_pop();
          REQUIRE(std::holds_alternative<events::stopped>(*fixture.out_queue->try_pop()));
          REQUIRE(state->finished());
        }
      }
    }

    WHEN("a save is queued and the input is closed before the writer runs")
    {
      fixture.in_queue->push(events::save{ .snapshot = persistence::serialize(session), .sequence = 7 });
      fixture.in_queue->close();
      fixture.io_context->poll();

      THEN("the pending save is still written before stopping")
      {
        REQUIRE(std::get<events::written>(*fixture.out_queue->try_pop()).sequence == 7);
        REQUIRE(std::holds_alternative<events::stopped>(*fixture.out_queue->try_pop()));
      }
    }
  }

  GIVEN("A writer whose target directory does not exist")
  {
    writer_fixture fixture("missing/state");
    auto state = core::spawn_processor(fixture.io_context, fixture.writer, nullptr, "state_writer");

    WHEN("a snapshot is saved")
    {
      fixture.in_queue->push(events::save{ .snapshot = { 1, 2, 3 }, .sequence = 3 });
      fixture.io_context->poll();

      THEN("the failure is reported and the writer keeps running")
      {
        const auto failed = std::get<events::write_failed>(*fixture.out_queue->try_pop());
        REQUIRE(failed.sequence == 3);
        REQUIRE_FALSE(failed.reason.empty());
        REQUIRE_FALSE(state->finished());
      }
    }
  }

  GIVEN("A writer that cannot seal its snapshots")
  {
    writer_fixture fixture("state", crypto::bytes(5, 1));
    auto state = core::spawn_processor(fixture.io_context, fixture.writer, nullptr, "state_writer");

    WHEN("a snapshot is saved and the input is then closed")
    {
      fixture.in_queue->push(events::save{ .snapshot = { 1, 2, 3 }, .sequence = 4 });
      fixture.io_context->poll();
      const auto failed = fixture.out_queue->try_pop();
      fixture.in_queue->close();
      fixture.io_context->poll();

      THEN("the save is reported failed and the writer still stops cleanly")
      {
        REQUIRE(std::get<events::write_failed>(*failed).sequence == 4);
        REQUIRE(std::holds_alternative<events::stopped>(*fixture.out_queue->try_pop()));
        REQUIRE(state->finished());
        REQUIRE_FALSE(std::filesystem::exists(fixture.dir.path / "state"));
      }
    }
  }
}
