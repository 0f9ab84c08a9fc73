#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace courier::platform {

/**
 * @brief Prompts on the terminal and reads one line with echo disabled.
 *
 * Echo is only suppressed when stdin is a terminal; piped input is read as is.
 *
 * @return The line without its newline, or nullopt at end of input
 */
[[nodiscard]] auto read_secret(std::string_view prompt) -> std::optional<std::string>;

}// namespace courier::platform
