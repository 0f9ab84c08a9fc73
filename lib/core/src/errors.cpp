#include <core/errors.hpp>

namespace courier::core {

namespace {

  class courier_error_category final : public std::error_category
  {
  public:
    [[nodiscard]] auto name() const noexcept -> const char * override { return "courier"; }

    [[nodiscard]] auto message(int value) const -> std::string override
    {
      switch (static_cast<errc>(value)) {
      case errc::malformed_handshake:
        return "malformed key exchange";
      case errc::invalid_public_key:
        return "invalid public key in key exchange";
      case errc::invalid_signature:
        return "key exchange signature does not verify";
      case errc::invalid_address:
        return "invalid server address in key exchange";
      case errc::invalid_group_credential:
        return "invalid group credential in key exchange";
      case errc::invalid_dh_value:
        return "invalid DH value in key exchange";
      case errc::contact_not_pending:
        return "contact has already completed its key exchange";
      case errc::no_handshake_found:
        return "no key exchange block found";
      case errc::message_too_large:
        return "message too large";
      case errc::duplicate_contact_name:
        return "a contact by that name already exists";
      case errc::unknown_contact:
        return "no such contact";
      case errc::unknown_message:
        return "no such message";
      case errc::contact_pending:
        return "contact has not completed its key exchange";
      case errc::incorrect_passphrase:
        return "incorrect passphrase";
      case errc::corrupt_state:
        return "state file is corrupt";
      }
      return "unknown courier error";
    }
  };

}// namespace

auto courier_category() noexcept -> const std::error_category &
{
  static const courier_error_category category;
  return category;
}

auto make_error_code(errc err) noexcept -> std::error_code { return { static_cast<int>(err), courier_category() }; }

auto raise(errc err, const std::string &what) -> void
{
  if (what.empty()) { throw std::system_error(make_error_code(err)); }
  throw std::system_error(make_error_code(err), what);
}

}// namespace courier::core
