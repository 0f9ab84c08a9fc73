#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <platform/env_utils.hpp>
#include <platform/time_utils.hpp>
#include <cstdint>
#include <regex>

TEST_CASE("format_current_time_hms returns HH:MM:SS format", "[platform][time]")
{
  auto result = courier::platform::format_current_time_hms();

  const std::regex hms_pattern(R"(\d{2}:\d{2}:\d{2})");
  REQUIRE(std::regex_match(result, hms_pattern));
}

TEST_CASE("format_timestamp renders dates and the unset marker", "[platform][time]")
{
  SECTION("zero means unset")
  {
    CHECK(courier::platform::format_timestamp(0) == "-");
  }

  SECTION("a set time is YYYY-MM-DD HH:MM")
  {
    constexpr std::int64_t some_time = 1'700'000'000;
    const std::regex date_pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2})");
    REQUIRE(std::regex_match(courier::platform::format_timestamp(some_time), date_pattern));
  }
}

TEST_CASE("unix_time follows the system clock", "[platform][time]")
{
  using namespace std::chrono;
  const auto before = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
  const auto now = courier::platform::unix_time();
  const auto after = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();

  CHECK(now >= before);
  CHECK(now <= after);
}

TEST_CASE("expand_tilde_path expands only a leading ~/", "[platform][env]")
{
  const auto home = courier::platform::get_home_directory();

  CHECK(courier::platform::expand_tilde_path("/abs/path") == "/abs/path");
  CHECK(courier::platform::expand_tilde_path("rel/~/path") == "rel/~/path");
  if (not home.empty()) { CHECK(courier::platform::expand_tilde_path("~/state") == home + "/state"); }
}

TEST_CASE("get_env treats unset variables as absent", "[platform][env]")
{
  CHECK_FALSE(courier::platform::get_env("COURIER_TEST_VARIABLE_THAT_IS_NOT_SET").has_value());
}
