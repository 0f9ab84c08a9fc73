#pragma once

#include <cstdint>
#include <string>

namespace courier::platform {

/**
 * @brief Seconds since the Unix epoch, the timestamp unit stored in session state.
 */
[[nodiscard]] auto unix_time() -> std::int64_t;

/**
 * @brief Formats the current local time as HH:MM:SS.
 */
[[nodiscard]] auto format_current_time_hms() -> std::string;

/**
 * @brief Formats a stored timestamp as local "YYYY-MM-DD HH:MM".
 *
 * @param seconds Seconds since the Unix epoch; zero formats as "-"
 */
[[nodiscard]] auto format_timestamp(std::int64_t seconds) -> std::string;

}// namespace courier::platform
