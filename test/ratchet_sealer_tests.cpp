#include <catch2/catch_test_macros.hpp>
#include <crypto/bytes.hpp>
#include <lifecycle/lifecycle.hpp>
#include <lifecycle/ratchet_sealer.hpp>
#include <model/message_record.hpp>
#include <optional>
#include <string>
#include <tuple>

#include "test_doubles/session_fixture.hpp"

using namespace courier;
using courier_test::paired_sessions;
using courier_test::test_now;

SCENARIO("Records sealed by one side open on the other", "[lifecycle][ratchet_sealer]")
{
  GIVEN("Two paired sessions")
  {
    paired_sessions pair;
    const lifecycle::ratchet_sealer sealer;

    WHEN("Alice seals her first message")
    {
      const auto record = lifecycle::compose(pair.alice, pair.bob_at_alice, "hi bob", {}, std::nullopt, test_now);
      const auto sealed = sealer.seal(pair.bob_contact(), record);

      THEN("Bob opens it with the scalar he advertised in his key exchange")
      {
        const auto opened = sealer.unseal(pair.alice_contact(), sealed);
        REQUIRE(opened.has_value());
        REQUIRE(*opened == record);
        REQUIRE_FALSE(pair.alice_contact().ratchet.current_confirmed);
      }

      THEN("the plaintext does not appear in the sealed bytes")
      {
        const auto text = crypto::to_string(sealed);
        REQUIRE(text.find("hi bob") == std::string::npos);
      }

      THEN("a flipped byte does not open")
      {
        auto damaged = sealed;
        damaged.back() ^= 0x01U;
        REQUIRE_FALSE(sealer.unseal(pair.alice_contact(), damaged).has_value());
      }

      THEN("a third party cannot open it")
      {
        paired_sessions strangers;
        REQUIRE_FALSE(sealer.unseal(strangers.alice_contact(), sealed).has_value());
      }
    }

    WHEN("Bob answers to Alice's advertised next value and Alice unseals it")
    {
      const auto first = lifecycle::compose(pair.alice, pair.bob_at_alice, "ping", {}, std::nullopt, test_now);
      std::ignore = sealer.unseal(pair.alice_contact(), sealer.seal(pair.bob_contact(), first));
      pair.alice_contact().ratchet.observe_remote(first.my_next_dh);

      const auto answer = lifecycle::compose(pair.bob, pair.alice_at_bob, "pong", {}, first.id, test_now);
      const auto opened = sealer.unseal(pair.bob_contact(), sealer.seal(pair.alice_contact(), answer));

      THEN("Alice opens it with her current scalar and marks it confirmed")
      {
        REQUIRE(opened.has_value());
        REQUIRE(model::body_text(*opened) == "pong");
        REQUIRE(pair.bob_contact().ratchet.current_confirmed);
      }
    }
  }
}

TEST_CASE("Sealing without ratchet state is a defect", "[lifecycle][ratchet_sealer]")
{
  const lifecycle::ratchet_sealer sealer;
  const model::contact empty{ .id = 1, .name = "nobody" };
  CHECK_THROWS_AS(sealer.seal(empty, model::message_record{ .id = 1 }), core::defect_error);
}
