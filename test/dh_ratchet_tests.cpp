#include <catch2/catch_test_macros.hpp>
#include <crypto/x25519.hpp>
#include <model/dh_ratchet.hpp>

using namespace courier;

SCENARIO("The local ring rotates once the peer confirms the current value", "[model][dh_ratchet]")
{
  GIVEN("A ratchet seeded by a key exchange")
  {
    model::dh_ratchet ratchet;
    const auto advertised = ratchet.seed_local();

    THEN("only the previous slot holds the advertised scalar")
    {
      REQUIRE(ratchet.local.previous.has_value());
      REQUIRE(crypto::x25519::public_from_private(*ratchet.local.previous) == advertised);
      REQUIRE_FALSE(ratchet.local.current.has_value());
      REQUIRE(ratchet.sending_private() == ratchet.local.previous);
    }

    WHEN("the first message is composed")
    {
      const auto first = ratchet.next_local_public();

      THEN("a fresh current scalar is drawn")
      {
        REQUIRE(ratchet.local.current.has_value());
        REQUIRE(first != advertised);
        REQUIRE(crypto::x25519::public_from_private(*ratchet.local.previous) == advertised);
      }

      AND_WHEN("another message is composed before the peer used it")
      {
        THEN("the same value is repeated") { REQUIRE(ratchet.next_local_public() == first); }
      }

      AND_WHEN("the peer confirms the current value")
      {
        const auto confirmed_scalar = *ratchet.local.current;
        ratchet.current_confirmed = true;
        const auto second = ratchet.next_local_public();

        THEN("current moves to previous and a new value is drawn")
        {
          REQUIRE(second != first);
          REQUIRE(ratchet.local.previous == confirmed_scalar);
          REQUIRE_FALSE(ratchet.current_confirmed);
        }
      }
    }
  }
}

SCENARIO("The remote ring follows the peer's advertised values", "[model][dh_ratchet]")
{
  GIVEN("A ratchet seeded with the peer's key exchange value")
  {
    model::dh_ratchet ratchet;
    const auto initial = crypto::x25519::public_from_private(crypto::x25519::generate_private());
    ratchet.seed_remote(initial);

    THEN("both remote slots hold it") { REQUIRE(ratchet.remote.previous == ratchet.remote.current); }

    WHEN("the peer advertises a new value")
    {
      const auto next = crypto::x25519::public_from_private(crypto::x25519::generate_private());

      THEN("the ring advances once")
      {
        REQUIRE(ratchet.observe_remote(next));
        REQUIRE(ratchet.remote.current == next);
        REQUIRE(ratchet.remote.previous == initial);
        REQUIRE_FALSE(ratchet.observe_remote(next));
      }
    }

    THEN("all-zero and low-order values are ignored")
    {
      REQUIRE_FALSE(ratchet.observe_remote(crypto::key32{}));
      REQUIRE_FALSE(ratchet.observe_remote(crypto::key32{ 1 }));
      REQUIRE(ratchet.remote.current == initial);
    }
  }
}
