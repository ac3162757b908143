#include <mutual/protocol/account.hpp>

#include <algorithm>

namespace mutual::protocol {

account::operator crypto::public_key() const noexcept
{
  return crypto::public_key( crypto::public_key_span( *this ) );
}

bool account::null() const noexcept
{
  return std::ranges::all_of( *this,
                              []( std::byte b )
                              {
                                return b == std::byte{ 0x00 };
                              } );
}

account_view::account_view( const account& acc ) noexcept:
    std::span< const std::byte, crypto::public_key_length >( acc )
{}

account_view::account_view( const std::byte* ptr, std::size_t length ) noexcept:
    std::span< const std::byte, crypto::public_key_length >( ptr, length )
{}

account_view::operator crypto::public_key() const noexcept
{
  return crypto::public_key( crypto::public_key_span( *this ) );
}

account_view::operator account() const noexcept
{
  account a;
  std::ranges::copy( *this, a.begin() );
  return a;
}

account user_account( const crypto::public_key& pub_key ) noexcept
{
  account a;
  std::ranges::copy( pub_key.bytes(), a.begin() );
  return a;
}

account system_program( std::string_view str ) noexcept
{
  account a{};

  std::size_t length = std::min( str.length(), a.size() );
  for( std::size_t i = 0; i < length; ++i )
    a.at( i ) = static_cast< std::byte >( str[ i ] );

  return a;
}

} // namespace mutual::protocol
