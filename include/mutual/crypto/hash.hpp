#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace mutual::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

void hasher_reset() noexcept;
digest hasher_finalize() noexcept;
void hasher_update( const void* ptr, std::size_t len ) noexcept;
void hasher_update( std::span< const std::byte > s ) noexcept;
void hasher_update( std::string_view sv ) noexcept;

template< typename T >
  requires std::is_integral_v< T >
void hasher_update( T t ) noexcept
{
  if constexpr( std::endian::native != std::endian::little )
    t = std::byteswap( t );

  hasher_update( &t, sizeof( T ) );
}

digest hash( const void* ptr, std::size_t len );
digest hash( const char* s ) noexcept;
digest hash( const std::string& s ) noexcept;
digest hash( std::string_view sv ) noexcept;
digest hash( std::span< const std::byte > s ) noexcept;

} // namespace mutual::crypto
