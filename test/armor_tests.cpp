#include <catch2/catch_test_macros.hpp>
#include <crypto/armor.hpp>
#include <crypto/bytes.hpp>
#include <string>

using namespace courier::crypto;

TEST_CASE("base64 matches RFC 4648 vectors", "[armor][base64]")
{
  CHECK(base64_encode(to_bytes("")).empty());
  CHECK(base64_encode(to_bytes("f")) == "Zg==");
  CHECK(base64_encode(to_bytes("fo")) == "Zm8=");
  CHECK(base64_encode(to_bytes("foobar")) == "Zm9vYmFy");

  CHECK(base64_decode("Zg==") == to_bytes("f"));
  CHECK(base64_decode("Zm9v\nYmFy") == to_bytes("foobar"));
  CHECK_FALSE(base64_decode("Zm9").has_value());
}

TEST_CASE("base32 matches RFC 4648 vectors", "[armor][base32]")
{
  CHECK(base32_encode(to_bytes("f")) == "MY");
  CHECK(base32_encode(to_bytes("foobar")) == "MZXW6YTBOI");

  CHECK(base32_decode("MZXW6YTBOI") == to_bytes("foobar"));
  CHECK(base32_decode("mzxw6ytboi") == to_bytes("foobar"));
  CHECK(base32_decode("MY======") == to_bytes("f"));
  CHECK_FALSE(base32_decode("MZ1W").has_value());
}

SCENARIO("Armored blocks survive surrounding text", "[armor]")
{
  GIVEN("A block embedded in an email body")
  {
    bytes data(200);
    for (std::size_t i = 0; i < data.size(); ++i) { data[i] = static_cast<std::uint8_t>(i); }
    const auto block = armor("COURIER KEY EXCHANGE", data);
    const auto pasted = "Hi, here is my key:\n\n" + block + "\nSee you\n";

    THEN("lines are at most 64 characters")
    {
      std::size_t start = 0;
      while (start < block.size()) {
        const auto end = block.find('\n', start);
        REQUIRE(end - start <= 64);
        start = end + 1;
      }
    }

    THEN("dearmor recovers the data") { REQUIRE(dearmor("COURIER KEY EXCHANGE", pasted) == data); }

    THEN("a different label is not found") { REQUIRE_FALSE(dearmor("OTHER", pasted).has_value()); }
  }

  GIVEN("Text without an end marker")
  {
    THEN("nothing is found")
    {
      REQUIRE_FALSE(dearmor("COURIER KEY EXCHANGE", "-----BEGIN COURIER KEY EXCHANGE-----\nAAAA\n").has_value());
    }
  }
}
