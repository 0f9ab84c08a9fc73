#include <platform/time_utils.hpp>

#include <chrono>
#include <ctime>
#include <fmt/format.h>
#include <tuple>

namespace courier::platform {

namespace {

  auto local_time(std::time_t when) -> std::tm
  {
    std::tm time_tm{};
    std::ignore = localtime_r(&when, &time_tm);
    return time_tm;
  }

}// namespace

auto unix_time() -> std::int64_t
{
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

auto format_current_time_hms() -> std::string
{
  const auto time_tm = local_time(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
  return fmt::format("{:02d}:{:02d}:{:02d}", time_tm.tm_hour, time_tm.tm_min, time_tm.tm_sec);
}

auto format_timestamp(std::int64_t seconds) -> std::string
{
  if (seconds == 0) { return "-"; }

  static constexpr int tm_year_base = 1900;
  const auto time_tm = local_time(static_cast<std::time_t>(seconds));
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}",
    time_tm.tm_year + tm_year_base,
    time_tm.tm_mon + 1,
    time_tm.tm_mday,
    time_tm.tm_hour,
    time_tm.tm_min);
}

}// namespace courier::platform
