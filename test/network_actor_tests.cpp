#include <async/async_queue.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <core/events.hpp>
#include <core/processor_runner.hpp>
#include <memory>
#include <model/message_queue.hpp>
#include <network/network_actor.hpp>
#include <string>
#include <variant>
#include <vector>

#include "test_doubles/test_double_transport.hpp"

using namespace courier;

namespace {

using actor_t = network::network_actor<courier_test::test_double_transport>;

struct network_fixture
{
  std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
  std::shared_ptr<courier_test::test_double_transport> transport =
    std::make_shared<courier_test::test_double_transport>();
  std::shared_ptr<actor_t::in_queue_t> in_queue = std::make_shared<actor_t::in_queue_t>(io_context);
  std::shared_ptr<model::message_queue> outgoing = std::make_shared<model::message_queue>();
  std::shared_ptr<actor_t::session_queue_t> session_queue = std::make_shared<actor_t::session_queue_t>(io_context);
  std::shared_ptr<actor_t> actor =
    std::make_shared<actor_t>(transport, io_context, in_queue, outgoing, session_queue);

  auto queue_delivery(std::uint64_t id) -> void
  {
    outgoing->enqueue(core::events::delivery{ .id = id, .to = 1, .server = "server", .payload = { 0x01 } });
  }
};

}// namespace

SCENARIO("A transaction delivers queued messages in order", "[network][deliver]")
{
  GIVEN("Three queued messages and a running actor")
  {
    network_fixture fixture;
    fixture.queue_delivery(1);
    fixture.queue_delivery(2);
    fixture.queue_delivery(3);
    auto state = core::spawn_processor(fixture.io_context, fixture.actor, nullptr, "network");

    WHEN("the server accepts everything")
    {
      bool completed = false;
      fixture.in_queue->push(core::events::network::trigger{ .on_complete = [&completed] { completed = true; } });
      fixture.io_context->poll();

      THEN("each is delivered in order and reported sent")
      {
        REQUIRE(fixture.transport->delivered.size() == 3);
        REQUIRE(fixture.transport->delivered[0].id == 1);
        REQUIRE(fixture.transport->delivered[2].id == 3);
        REQUIRE(fixture.outgoing->empty());
        for (const std::uint64_t expected : { 1U, 2U, 3U }) {
          auto evt = fixture.session_queue->try_pop();
          REQUIRE(evt.has_value());
          REQUIRE(std::get<core::events::network::message_sent>(*evt).id == expected);
        }
        REQUIRE(completed);
      }
    }

    WHEN("the server refuses the second message")
    {
      fixture.transport->accept_limit = 1;
      fixture.in_queue->push(core::events::network::trigger{});
      fixture.io_context->poll();

      THEN("delivery stops there and the rest stay queued")
      {
        REQUIRE(fixture.transport->delivered.size() == 1);
        REQUIRE(fixture.outgoing->size() == 2);
        REQUIRE(fixture.outgoing->front()->id == 2);
        REQUIRE(fixture.session_queue->size() == 1);
      }
    }

    fixture.in_queue->close();
    fixture.io_context->poll();
    REQUIRE(state->finished());
  }
}

SCENARIO("Fetched records are released only after the session acknowledges them", "[network][fetch]")
{
  GIVEN("Two records waiting on the server")
  {
    network_fixture fixture;
    fixture.transport->add_record({ 0xA1 });
    fixture.transport->add_record({ 0xA2 });
    auto state = core::spawn_processor(fixture.io_context, fixture.actor, nullptr, "network");

    WHEN("a transaction runs")
    {
      bool completed = false;
      fixture.in_queue->push(core::events::network::trigger{ .on_complete = [&completed] { completed = true; } });
      fixture.io_context->poll();

      THEN("only the first record is handed over and nothing is released")
      {
        REQUIRE(fixture.session_queue->size() == 1);
        REQUIRE(fixture.transport->released.empty());
        REQUIRE(fixture.transport->fetch()->handle == "record-1");
        REQUIRE_FALSE(completed);
        REQUIRE_FALSE(state->finished());
      }

      AND_WHEN("the session acknowledges each record in turn")
      {
        auto first = std::get<core::events::network::new_message>(*fixture.session_queue->try_pop());
        REQUIRE(first.record.payload == std::vector<std::uint8_t>{ 0xA1 });
        first.ack(true);
        fixture.io_context->poll();

        auto second = std::get<core::events::network::new_message>(*fixture.session_queue->try_pop());
        REQUIRE(second.record.payload == std::vector<std::uint8_t>{ 0xA2 });
        REQUIRE(fixture.transport->released == std::vector<std::string>{ "record-1" });
        second.ack(true);
        fixture.io_context->poll();

        THEN("both are released and the transaction completes")
        {
          REQUIRE(fixture.transport->released == std::vector<std::string>{ "record-1", "record-2" });
          REQUIRE(completed);
          REQUIRE(fixture.session_queue->empty());
        }
      }

      AND_WHEN("the session could not store the first record")
      {
        auto first = std::get<core::events::network::new_message>(*fixture.session_queue->try_pop());
        first.ack(false);
        fixture.io_context->poll();

        THEN("the transaction ends with the record still on the server")
        {
          REQUIRE(fixture.transport->released.empty());
          REQUIRE(fixture.session_queue->empty());
          REQUIRE(completed);
          REQUIRE_FALSE(state->finished());
        }

        AND_WHEN("the next transaction runs")
        {
          fixture.in_queue->push(core::events::network::trigger{});
          fixture.io_context->poll();

          THEN("the same record is handed over again")
          {
            auto again = std::get<core::events::network::new_message>(*fixture.session_queue->try_pop());
            REQUIRE(again.record.handle == "record-1");
            REQUIRE(again.record.payload == std::vector<std::uint8_t>{ 0xA1 });
          }
        }
      }
    }
  }

  GIVEN("A session queue that has been closed")
  {
    network_fixture fixture;
    fixture.transport->add_record({ 0xB1 });
    fixture.session_queue->close();
    auto state = core::spawn_processor(fixture.io_context, fixture.actor, nullptr, "network");

    WHEN("a transaction runs")
    {
      fixture.in_queue->push(core::events::network::trigger{});
      fixture.io_context->poll();

      THEN("nothing is released and the actor keeps running")
      {
        REQUIRE(fixture.transport->released.empty());
        REQUIRE_FALSE(state->finished());
      }
    }
  }
}

SCENARIO("The network actor transacts on its timer", "[network][timer]")
{
  GIVEN("An actor with a short fetch interval")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto transport = std::make_shared<courier_test::test_double_transport>();
    auto in_queue = std::make_shared<actor_t::in_queue_t>(io_context);
    auto session_queue = std::make_shared<actor_t::session_queue_t>(io_context);
    auto actor = std::make_shared<actor_t>(transport,
      io_context,
      in_queue,
      std::make_shared<model::message_queue>(),
      session_queue,
      std::chrono::milliseconds(5));
    auto signal = std::make_shared<boost::asio::cancellation_signal>();
    auto slot = std::make_shared<boost::asio::cancellation_slot>(signal->slot());
    auto state = core::spawn_processor(io_context, actor, slot, "network");

    WHEN("time passes")
    {
      const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
      while (transport->fetch_calls < 2 and std::chrono::steady_clock::now() < deadline) {
        io_context->run_one_for(std::chrono::milliseconds(20));
      }

      THEN("it has fetched more than once without being triggered") { REQUIRE(transport->fetch_calls >= 2); }
    }

    signal->emit(boost::asio::cancellation_type::all);
    io_context->poll();
    REQUIRE(state->finished());
  }
}
