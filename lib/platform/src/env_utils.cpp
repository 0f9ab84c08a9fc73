#include <platform/env_utils.hpp>

#include <cstdlib>
#include <mutex>

namespace courier::platform {

auto get_env(const char *name) -> std::optional<std::string>
{
  static std::mutex env_mutex;
  const std::scoped_lock lock(env_mutex);

  const char *value = std::getenv(name);// NOLINT(concurrency-mt-unsafe)
  if (value == nullptr or *value == '\0') { return std::nullopt; }
  return std::string(value);
}

auto get_home_directory() -> std::string { return get_env("HOME").value_or(""); }

auto get_temp_directory() -> std::string { return get_env("TMPDIR").value_or("/tmp"); }

auto get_data_directory() -> std::string
{
  if (auto xdg = get_env("XDG_DATA_HOME")) { return *xdg + "/courier"; }
  return expand_tilde_path("~/.local/share/courier");
}

auto expand_tilde_path(const std::string &path) -> std::string
{
  if (not path.starts_with("~/")) { return path; }

  auto home = get_home_directory();
  if (home.empty()) { return path; }

  return home + path.substr(1);
}

}// namespace courier::platform
