#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/errors.hpp>
#include <core/events.hpp>
#include <core/processor_runner.hpp>
#include <crypto/bytes.hpp>
#include <filesystem>
#include <handshake/handshake.hpp>
#include <lifecycle/ratchet_sealer.hpp>
#include <memory>
#include <model/message_record.hpp>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <tuple>
#include <variant>

#include "test_doubles/coordinator_fixture.hpp"

using namespace courier;
namespace events = core::events;

namespace {

using fixture_t = courier_test::coordinator_fixture<lifecycle::ratchet_sealer>;

/// Hands the front of the sender's queue to the recipient as a fetched record.
auto deliver_next(fixture_t &from, fixture_t &to, bool &acked) -> std::uint64_t
{
  const auto item = from.state().queue->front();
  if (not item) { throw std::runtime_error("nothing queued"); }
  to.send(events::network::new_message{ .record = { .credential = item->credential,
                                          .generation = item->generation,
                                          .payload = item->payload,
                                          .handle = "record" },
    .ack = [&acked](bool durable) { acked = durable; } });
  return item->id;
}

struct failing_sealer
{
  auto seal(const model::contact & /*peer*/, const model::message_record & /*record*/) const -> crypto::bytes
  {
    throw core::defect_error("sealer broke");
  }

  auto unseal(model::contact & /*peer*/, std::span<const std::uint8_t> /*sealed*/) const
    -> std::optional<model::message_record>
  {
    return std::nullopt;
  }
};

}// namespace

SCENARIO("Contacts are created and completed through the coordinator", "[coordinator][contacts]")
{
  GIVEN("A running coordinator")
  {
    fixture_t alice("alice.example");

    WHEN("a contact is created")
    {
      const auto armored = alice.create_contact("bob");

      THEN("the armored key exchange is shown and the pending contact is saved")
      {
        REQUIRE(armored.find("COURIER KEY EXCHANGE") != std::string::npos);
        const auto saved = alice.saved_state();
        REQUIRE(saved.contacts.size() == 1);
        REQUIRE(saved.contacts.begin()->second.pending);
        REQUIRE(saved.contacts.begin()->second.name == "bob");
      }

      AND_WHEN("a second contact with the same name is created")
      {
        alice.send(events::create_contact{ .name = "bob" });

        THEN("it fails without changing the session")
        {
          const auto failed = alice.expect<events::operation_failed>();
          REQUIRE(failed.error == core::errc::duplicate_contact_name);
          REQUIRE(failed.operation == "new contact");
          REQUIRE(alice.state().contacts.size() == 1);
        }
      }

      AND_WHEN("text without a key exchange is applied")
      {
        alice.send(events::apply_handshake{ .contact = "bob", .armored = "hello there" });

        THEN("no key exchange is found")
        {
          REQUIRE(alice.expect<events::operation_failed>().error == core::errc::no_handshake_found);
          REQUIRE(alice.state().contacts.begin()->second.pending);
        }
      }

      AND_WHEN("a key exchange is applied to a contact that does not exist")
      {
        alice.send(events::apply_handshake{ .contact = "carol", .armored = armored });

        THEN("it is refused and the contact stays pending")
        {
          const auto failed = alice.expect<events::operation_failed>();
          REQUIRE(failed.error == core::errc::unknown_contact);
          REQUIRE(failed.operation == "key exchange");
          REQUIRE(alice.state().contacts.begin()->second.pending);
        }
      }

      AND_WHEN("the contact is shown")
      {
        alice.send(events::show_contact{ .name = "bob" });

        THEN("its pending key exchange is included")
        {
          const auto details = alice.expect<events::contact_details>();
          REQUIRE(details.pending);
          REQUIRE(details.armored_handshake == armored);
        }
      }
    }

    WHEN("a message is composed to an unknown contact")
    {
      alice.send(events::compose{ .contact = "nobody", .body = "hi" });

      THEN("it fails with unknown_contact")
      {
        const auto failed = alice.expect<events::operation_failed>();
        REQUIRE(failed.error == core::errc::unknown_contact);
        REQUIRE(failed.operation == "send");
      }
    }

    WHEN("the identity is shown")
    {
      alice.send(events::show_identity{});

      THEN("the server and public identity are reported")
      {
        const auto shown = alice.expect<events::identity_shown>();
        REQUIRE(shown.server == alice.state().self.server);
        REQUIRE(shown.identity_public_hex == crypto::to_hex(alice.state().self.identity_public));
      }
    }
  }
}

SCENARIO("Messages flow between paired coordinators", "[coordinator][messages]")
{
  GIVEN("Alice and Bob have exchanged keys")
  {
    fixture_t alice("alice.example");
    fixture_t bob("bob.example");
    courier_test::pair_coordinators(alice, bob);

    WHEN("Alice sends a message")
    {
      alice.send(events::compose{ .contact = "bob", .body = "hello bob" });

      THEN("it is queued, saved and the network actor is woken")
      {
        const auto queued = alice.expect<events::message_queued>();
        REQUIRE(queued.to == "bob");
        REQUIRE_FALSE(queued.usage.empty());
        REQUIRE(alice.state().queue->size() == 1);
        REQUIRE(alice.saved_state().outbox.size() == 1);
        REQUIRE(alice.queues.network->try_pop().has_value());
      }

      AND_WHEN("the server accepts it")
      {
        const auto id = alice.state().queue->front()->id;
        alice.now += 5;
        alice.send(events::network::message_sent{ .id = id });

        THEN("it is marked sent")
        {
          REQUIRE(alice.expect<events::message_sent>().id == id);
          REQUIRE(alice.saved_state().outbox.front().sent == courier_test::test_now + 5);
        }
      }

      AND_WHEN("Bob fetches it")
      {
        bool acked = false;
        std::ignore = deliver_next(alice, bob, acked);

        THEN("it is stored durably before the network is told to release it")
        {
          REQUIRE(acked);
          const auto received = bob.expect<events::message_received>();
          REQUIRE(received.from == "alice");
          REQUIRE_FALSE(received.sealed);
          REQUIRE(bob.saved_state().inbox.size() == 1);
        }

        AND_WHEN("Bob opens and replies to it and Alice fetches the reply")
        {
          const auto inbound_id = bob.expect<events::message_received>().id;
          bob.send(events::open_inbound{ .inbound_id = inbound_id });
          const auto opened = bob.expect<events::inbound_opened>();
          bob.send(events::reply{ .inbound_id = inbound_id, .body = "hello alice" });

          bool reply_acked = false;
          std::ignore = deliver_next(bob, alice, reply_acked);

          THEN("Bob read the text and Alice's message is acknowledged")
          {
            REQUIRE(opened.body == "hello bob");
            REQUIRE(reply_acked);
            REQUIRE(alice.expect<events::message_acked>().to == "bob");
            REQUIRE(alice.expect<events::message_received>().from == "bob");
            REQUIRE(alice.state().outbox.front().status() == events::outbound_status::acked);
          }
        }
      }
    }

    WHEN("a record with a forged credential is fetched")
    {
      bool acked = false;
      bob.send(events::network::new_message{
        .record = { .credential = crypto::bytes(72, 0x00), .generation = 0, .payload = { 1 }, .handle = "x" },
        .ack = [&acked](bool durable) { acked = durable; } });

      THEN("it is released without touching the session")
      {
        REQUIRE(acked);
        REQUIRE(bob.state().inbox.empty());
        REQUIRE_FALSE(bob.next_event().has_value());
      }
    }

    WHEN("the lists are requested")
    {
      alice.send(events::compose{ .contact = "bob", .body = "one" });
      alice.send(events::list_contacts{});
      alice.send(events::list_outbox{});
      alice.send(events::list_inbox{});

      THEN("each reflects the session")
      {
        REQUIRE(alice.expect<events::contacts_listed>().contacts.size() == 1);
        const auto outbox = alice.expect<events::outbox_listed>();
        REQUIRE(outbox.messages.size() == 1);
        REQUIRE(outbox.messages.front().status == events::outbound_status::queued);
        REQUIRE(alice.expect<events::inbox_listed>().messages.empty());
      }
    }
  }
}

SCENARIO("A fetched record that cannot be saved stays on the server", "[coordinator][durability]")
{
  GIVEN("Alice has sent Bob a message and Bob's state directory has gone away")
  {
    fixture_t alice("alice.example");
    fixture_t bob("bob.example");
    courier_test::pair_coordinators(alice, bob);
    alice.send(events::compose{ .contact = "bob", .body = "are you there" });
    std::filesystem::remove_all(bob.dir.path);

    WHEN("Bob fetches it")
    {
      bool acked = true;
      std::ignore = deliver_next(alice, bob, acked);

      THEN("the network is told to keep it and the session is unchanged")
      {
        REQUIRE_FALSE(acked);
        REQUIRE(bob.state().inbox.empty());
        REQUIRE(bob.expect<events::operation_failed>().operation == "save");
        REQUIRE_FALSE(bob.next_event().has_value());
      }

      AND_WHEN("the directory is back and the record is fetched again")
      {
        std::filesystem::create_directories(bob.dir.path);
        bool stored = false;
        std::ignore = deliver_next(alice, bob, stored);

        THEN("it is stored exactly once")
        {
          REQUIRE(stored);
          REQUIRE(bob.state().inbox.size() == 1);
          REQUIRE(bob.saved_state().inbox.size() == 1);
          REQUIRE(bob.expect<events::message_received>().from == "alice");
        }
      }
    }
  }
}

SCENARIO("A message from a contact whose key exchange is not yet applied is held", "[coordinator][held]")
{
  GIVEN("Alice has applied Bob's key exchange but Bob has not applied Alice's")
  {
    fixture_t alice("alice.example");
    fixture_t bob("bob.example");
    const auto from_alice = alice.create_contact("bob");
    const auto from_bob = bob.create_contact("alice");
    alice.send(events::apply_handshake{ .contact = "bob", .armored = from_bob });
    alice.send(events::compose{ .contact = "bob", .body = "early" });

    bool acked = false;
    std::ignore = deliver_next(alice, bob, acked);

    THEN("Bob holds it sealed")
    {
      REQUIRE(acked);
      REQUIRE(bob.expect<events::message_received>().sealed);
      REQUIRE(bob.state().inbox.front().is_sealed());
    }

    WHEN("Bob applies Alice's key exchange")
    {
      bob.send(events::apply_handshake{ .contact = "alice", .armored = from_alice });

      THEN("the held message is decoded")
      {
        REQUIRE(bob.expect<events::handshake_applied>().unsealed == 1);
        REQUIRE_FALSE(bob.state().inbox.front().is_sealed());
        REQUIRE(model::body_text(*bob.saved_state().inbox.front().record()) == "early");
      }
    }
  }
}

SCENARIO("Shutdown persists the session and closes the actors' queues", "[coordinator][shutdown]")
{
  GIVEN("A coordinator with a contact")
  {
    fixture_t alice("alice.example");
    std::ignore = alice.create_contact("bob");

    WHEN("shutdown is requested")
    {
      alice.send(events::shutdown{});

      THEN("the final state is on disk, the queues are closed and shutdown is reported")
      {
        REQUIRE(alice.coordinator->stopped());
        REQUIRE(alice.coordinator_state->finished());
        REQUIRE(alice.writer_state->finished());
        REQUIRE_FALSE(alice.queues.network->is_open());
        REQUIRE_FALSE(alice.queues.in->is_open());
        std::ignore = alice.expect<events::shutdown_complete>();

        const auto saved = alice.saved_state();
        REQUIRE(saved.self == alice.state().self);
        REQUIRE(saved.contacts == alice.state().contacts);
      }
    }

    WHEN("a fetch is requested")
    {
      alice.send(events::fetch_now{});

      THEN("the network actor is triggered and completion is reported through it")
      {
        auto trigger = alice.queues.network->try_pop();
        REQUIRE(trigger.has_value());
        std::get<events::network::trigger>(*trigger).on_complete();
        std::ignore = alice.expect<events::fetch_completed>();
      }
    }
  }

  GIVEN("Alice has a message that the network actor has taken off the queue")
  {
    fixture_t alice("alice.example");
    fixture_t bob("bob.example");
    courier_test::pair_coordinators(alice, bob);
    alice.send(events::compose{ .contact = "bob", .body = "sent once" });
    const auto id = alice.state().queue->front()->id;
    std::ignore = alice.state().queue->remove(id);

    WHEN("its delivery report arrives behind the shutdown request")
    {
      alice.queues.in->push(events::shutdown{});
      alice.queues.in->push(events::network::message_sent{ .id = id });
      alice.io_context->poll();

      THEN("the saved state records it as sent and will not queue it again")
      {
        std::ignore = alice.expect<events::shutdown_complete>();
        const auto saved = alice.saved_state();
        REQUIRE(saved.outbox.front().sent == courier_test::test_now);
        REQUIRE(saved.queue->empty());
      }
    }

    WHEN("shutdown is requested before any delivery report")
    {
      alice.send(events::shutdown{});

      THEN("the taken message is still saved as sent")
      {
        const auto saved = alice.saved_state();
        REQUIRE(saved.outbox.front().sent != 0);
        REQUIRE(saved.queue->empty());
      }
    }
  }

  GIVEN("Bob has a fetched record waiting behind the shutdown request")
  {
    fixture_t alice("alice.example");
    fixture_t bob("bob.example");
    courier_test::pair_coordinators(alice, bob);
    alice.send(events::compose{ .contact = "bob", .body = "not yet stored" });
    const auto item = alice.state().queue->front();

    std::optional<bool> acked;
    bob.queues.in->push(events::shutdown{});
    bob.queues.in->push(events::network::new_message{ .record = { .credential = item->credential,
                                                        .generation = item->generation,
                                                        .payload = item->payload,
                                                        .handle = "record" },
      .ack = [&acked](bool durable) { acked = durable; } });
    bob.io_context->poll();

    THEN("the record is left on the server for the next session")
    {
      REQUIRE(acked.has_value());
      REQUIRE_FALSE(*acked);
      REQUIRE(bob.saved_state().inbox.empty());
    }
  }

  GIVEN("A coordinator whose state writer never answers")
  {
    using coordinator_t = fixture_t::coordinator_t;
    auto io_context = std::make_shared<boost::asio::io_context>();
    coordinator_t::queues_t queues{ .in = std::make_shared<coordinator_t::in_queue_t>(io_context),
      .persistence = std::make_shared<coordinator_t::persistence_queue_t>(io_context),
      .persistence_done = std::make_shared<coordinator_t::persistence_done_queue_t>(io_context),
      .network = std::make_shared<coordinator_t::network_queue_t>(io_context),
      .presentation = std::make_shared<coordinator_t::presentation_queue_t>(io_context) };
    auto coordinator = std::make_shared<coordinator_t>(courier_test::make_state("alice.example"),
      std::make_shared<lifecycle::ratchet_sealer>(),
      queues,
      handshake::apply_options{ .allow_any_host = true },
      [] { return courier_test::test_now; });
    auto signal = std::make_shared<boost::asio::cancellation_signal>();
    auto slot = std::make_shared<boost::asio::cancellation_slot>(signal->slot());
    auto state = core::spawn_processor(io_context, coordinator, slot, "session_coordinator");

    queues.in->push(events::shutdown{});
    io_context->poll();

    THEN("shutdown waits for the final save")
    {
      REQUIRE_FALSE(state->finished());
      REQUIRE(queues.in->is_open());
    }

    WHEN("the coordinator is cancelled")
    {
      signal->emit(boost::asio::cancellation_type::all);
      io_context->poll();

      THEN("shutdown completes without the writer")
      {
        REQUIRE(state->finished());
        REQUIRE_FALSE(queues.in->is_open());
        REQUIRE_FALSE(queues.network->is_open());
        REQUIRE_FALSE(queues.persistence->is_open());
        bool completed = false;
        while (auto evt = queues.presentation->try_pop()) {
          completed = completed or std::holds_alternative<events::shutdown_complete>(*evt);
        }
        REQUIRE(completed);
      }
    }

    queues.in->close();
    signal->emit(boost::asio::cancellation_type::all);
    io_context->poll();
  }

  GIVEN("A coordinator whose sealer hits an internal error")
  {
    courier_test::coordinator_fixture<failing_sealer> broken("alice.example");
    courier_test::coordinator_fixture<failing_sealer> peer("bob.example");
    courier_test::pair_coordinators(broken, peer);

    WHEN("a message is sent")
    {
      broken.send(events::compose{ .contact = "bob", .body = "boom" });

      THEN("the coordinator runs its shutdown sequence and stops")
      {
        REQUIRE(broken.coordinator->stopped());
        REQUIRE(broken.coordinator_state->finished());
        std::ignore = broken.expect<events::shutdown_complete>();
      }
    }
  }
}
