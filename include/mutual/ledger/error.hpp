#pragma once

#include <expected>
#include <system_error>

namespace mutual::ledger {

enum class ledger_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  ownership_error,
  missing_signature,
  authorization_error,
  not_found,
  validation_error,
  arithmetic_error,
  invalid_state,
  compliance_error,
  unknown_operation,
  decode_error,
  capacity_error,
  missing_account
};

const std::error_category& ledger_category() noexcept;

std::error_code make_error_code( ledger_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mutual::ledger

template<>
struct std::is_error_code_enum< mutual::ledger::ledger_errc >: public std::true_type
{};
