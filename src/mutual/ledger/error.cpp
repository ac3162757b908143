#include <mutual/ledger/error.hpp>

#include <string>
#include <utility>

namespace mutual::ledger {

struct _ledger_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _ledger_category::name() const noexcept
{
  return "ledger";
}

std::string _ledger_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< ledger_errc >( condition ) )
  {
    case ledger_errc::ok:
      return "ok"s;
    case ledger_errc::ownership_error:
      return "record is not owned by this program"s;
    case ledger_errc::missing_signature:
      return "required signer is absent"s;
    case ledger_errc::authorization_error:
      return "signer lacks the required role"s;
    case ledger_errc::not_found:
      return "record not found"s;
    case ledger_errc::validation_error:
      return "validation error"s;
    case ledger_errc::arithmetic_error:
      return "arithmetic overflow or underflow"s;
    case ledger_errc::invalid_state:
      return "invalid state"s;
    case ledger_errc::compliance_error:
      return "compliance gate failed"s;
    case ledger_errc::unknown_operation:
      return "unknown operation"s;
    case ledger_errc::decode_error:
      return "decode error"s;
    case ledger_errc::capacity_error:
      return "record exceeds slot capacity"s;
    case ledger_errc::missing_account:
      return "missing account"s;
  }
  std::unreachable();
}

const std::error_category& ledger_category() noexcept
{
  static _ledger_category category;
  return category;
}

std::error_code make_error_code( ledger_errc e )
{
  return std::error_code( static_cast< int >( e ), ledger_category() );
}

} // namespace mutual::ledger
