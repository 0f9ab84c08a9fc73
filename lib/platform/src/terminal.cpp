#include <platform/terminal.hpp>

#include <cstdio>
#include <fmt/core.h>
#include <iostream>
#include <termios.h>
#include <tuple>
#include <unistd.h>

namespace courier::platform {

namespace {

  /// Restores the saved terminal attributes on scope exit.
  class echo_guard
  {
  public:
    echo_guard()
    {
      if (isatty(STDIN_FILENO) == 0 or tcgetattr(STDIN_FILENO, &saved_) != 0) { return; }
      termios silent = saved_;
      silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
      active_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
    }

    ~echo_guard()
    {
      if (active_) {
        std::ignore = tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
        fmt::print("\n");
      }
    }

    echo_guard(const echo_guard &) = delete;
    auto operator=(const echo_guard &) -> echo_guard & = delete;
    echo_guard(echo_guard &&) = delete;
    auto operator=(echo_guard &&) -> echo_guard & = delete;

  private:
    termios saved_{};
    bool active_{ false };
  };

}// namespace

auto read_secret(std::string_view prompt) -> std::optional<std::string>
{
  fmt::print("{}", prompt);
  std::fflush(stdout);

  const echo_guard guard;
  std::string line;
  if (not std::getline(std::cin, line)) { return std::nullopt; }
  return line;
}

}// namespace courier::platform
