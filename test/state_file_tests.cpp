#include <catch2/catch_test_macros.hpp>
#include <core/errors.hpp>
#include <crypto/kdf.hpp>
#include <crypto/random.hpp>
#include <filesystem>
#include <iterator>
#include <persistence/snapshot.hpp>
#include <persistence/state_file.hpp>
#include <stdexcept>
#include <system_error>
#include <tuple>

#include "test_doubles/session_fixture.hpp"
#include "test_doubles/temp_directory.hpp"

using namespace courier;

namespace {

constexpr crypto::kdf::scrypt_params cheap_params{ .n = 1024, .r = 8, .p = 1 };

auto load_error(const crypto::bytes &file, const crypto::key32 &key) -> std::error_code
{
  try {
    std::ignore = persistence::load(file, key);
  } catch (const std::system_error &e) {
    return e.code();
  }
  return {};
}

}// namespace

SCENARIO("State files are encrypted under a passphrase-derived key", "[persistence][state_file]")
{
  GIVEN("A session sealed with a passphrase")
  {
    const auto state = courier_test::make_state("alice.example");
    const auto salt = crypto::random_bytes(persistence::salt_size);
    const auto key = persistence::derive_key("correct horse", salt, cheap_params);
    const auto snapshot = persistence::serialize(state);
    const auto file = persistence::seal_state(key, salt, snapshot);

    THEN("a salt of the wrong length is refused")
    {
      REQUIRE_THROWS_AS(persistence::seal_state(key, crypto::bytes(5, 1), snapshot), std::invalid_argument);
    }

    THEN("the salt is stored in the clear at the start")
    {
      REQUIRE(persistence::read_salt(file) == salt);
    }

    THEN("the same passphrase and salt open it")
    {
      const auto rederived = persistence::derive_key("correct horse", persistence::read_salt(file), cheap_params);
      REQUIRE(persistence::open_state(rederived, file) == snapshot);
      REQUIRE(persistence::load(file, rederived).self == state.self);
    }

    THEN("a different passphrase is reported as incorrect")
    {
      const auto wrong = persistence::derive_key("battery staple", salt, cheap_params);
      REQUIRE(load_error(file, wrong) == core::errc::incorrect_passphrase);
    }

    THEN("the empty passphrase does not open it")
    {
      REQUIRE(load_error(file, persistence::derive_key("", salt)) == core::errc::incorrect_passphrase);
    }

    THEN("a truncated file is corrupt")
    {
      const crypto::bytes truncated(file.begin(), file.begin() + 10);
      REQUIRE(load_error(truncated, key) == core::errc::corrupt_state);
    }
  }

  GIVEN("An empty passphrase")
  {
    const auto salt = crypto::random_bytes(persistence::salt_size);

    THEN("the key is all zero regardless of salt")
    {
      REQUIRE(persistence::derive_key("", salt) == crypto::key32{});
      REQUIRE(persistence::derive_key("", crypto::random_bytes(persistence::salt_size)) == crypto::key32{});
    }
  }
}

SCENARIO("State files are replaced atomically", "[persistence][state_file]")
{
  GIVEN("A temporary directory")
  {
    courier_test::temp_directory dir;
    const auto path = dir.path / "state";

    WHEN("a file is written twice")
    {
      persistence::write_file_atomic(path, crypto::bytes{ 1, 2, 3 });
      persistence::write_file_atomic(path, crypto::bytes{ 4, 5 });

      THEN("it holds the last contents and no temporary is left behind")
      {
        REQUIRE(persistence::read_file(path) == crypto::bytes{ 4, 5 });
        const auto entries = std::distance(std::filesystem::directory_iterator(dir.path), {});
        REQUIRE(entries == 1);
      }

      THEN("only the owner can read or write it")
      {
        const auto permissions = std::filesystem::status(path).permissions();
        REQUIRE((permissions & std::filesystem::perms::all)
                == (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write));
      }
    }

    THEN("reading a missing file throws")
    {
      REQUIRE_THROWS_AS(persistence::read_file(dir.path / "missing"), std::filesystem::filesystem_error);
    }

    THEN("writing into a missing directory throws")
    {
      REQUIRE_THROWS_AS(
        persistence::write_file_atomic(dir.path / "no" / "such" / "state", crypto::bytes{ 1 }),
        std::filesystem::filesystem_error);
    }
  }
}
