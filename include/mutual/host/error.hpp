#pragma once

#include <expected>
#include <system_error>

namespace mutual::host {

enum class host_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_transaction,
  invalid_signature,
  unknown_program,
  unknown_account,
  read_only_account,
  stack_overflow,
  input_exhausted,
  bad_file_descriptor,
  duplicate_account
};

const std::error_category& host_category() noexcept;

std::error_code make_error_code( host_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mutual::host

template<>
struct std::is_error_code_enum< mutual::host::host_errc >: public std::true_type
{};
