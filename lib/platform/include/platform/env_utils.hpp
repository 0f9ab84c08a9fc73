#pragma once

#include <optional>
#include <string>

namespace courier::platform {

/**
 * @brief Reads an environment variable under a process-wide lock.
 */
[[nodiscard]] auto get_env(const char *name) -> std::optional<std::string>;

/**
 * @brief Returns the user's home directory, or an empty string if unknown.
 */
[[nodiscard]] auto get_home_directory() -> std::string;

/**
 * @brief Returns the system's temporary directory path.
 */
[[nodiscard]] auto get_temp_directory() -> std::string;

/**
 * @brief Directory holding courier's state file.
 *
 * $XDG_DATA_HOME/courier when set, otherwise ~/.local/share/courier.
 */
[[nodiscard]] auto get_data_directory() -> std::string;

/**
 * @brief Expands a leading "~/" to the home directory.
 *
 * @param path Path possibly starting with ~
 * @return Expanded path, or path unchanged if it has no tilde or no home is known
 */
[[nodiscard]] auto expand_tilde_path(const std::string &path) -> std::string;

}// namespace courier::platform
