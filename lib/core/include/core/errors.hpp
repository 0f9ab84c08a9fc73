#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace courier::core {

/**
 * @brief Recoverable failures reported to the user that initiated an operation.
 *
 * An operation that fails with one of these codes leaves session state untouched.
 */
enum class errc : int {
  malformed_handshake = 1,
  invalid_public_key,
  invalid_signature,
  invalid_address,
  invalid_group_credential,
  invalid_dh_value,
  contact_not_pending,
  no_handshake_found,
  message_too_large,
  duplicate_contact_name,
  unknown_contact,
  unknown_message,
  contact_pending,
  incorrect_passphrase,
  corrupt_state,
};

[[nodiscard]] auto courier_category() noexcept -> const std::error_category &;

[[nodiscard]] auto make_error_code(errc err) noexcept -> std::error_code;

/**
 * @brief Invariant violation inside the session core.
 *
 * Raised for internal inconsistencies (an id that must exist does not, a primitive
 * that cannot fail did). The coordinator stops processing when it sees one.
 */
class defect_error : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

/**
 * @brief Throws std::system_error carrying the given code.
 */
[[noreturn]] auto raise(errc err, const std::string &what = {}) -> void;

}// namespace courier::core

template<> struct std::is_error_code_enum<courier::core::errc> : std::true_type
{
};
