#pragma once

#include <expected>
#include <system_error>

namespace mutual::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok,
  unauthorized,
  invalid_instruction,
  insufficient_balance,
  insufficient_supply,
  invalid_argument,
  overflow,
  unexpected_object
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mutual::program

template<>
struct std::is_error_code_enum< mutual::program::program_errc >: public std::true_type
{};
