#include <mutual/crypto/public_key.hpp>
#include <mutual/memory.hpp>

#include <algorithm>
#include <cassert>

#include <sodium.h>

namespace mutual::crypto {

static void initialize_crypto()
{
  [[maybe_unused]]
  static int retval = sodium_init();
  assert( retval >= 0 );
}

public_key::public_key( public_key_span pks ) noexcept
{
  initialize_crypto();
  std::ranges::copy( pks, _bytes.begin() );
}

bool public_key::operator==( const public_key& rhs ) const noexcept
{
  return std::ranges::equal( _bytes, rhs.bytes() );
}

bool public_key::operator!=( const public_key& rhs ) const noexcept
{
  return !( *this == rhs );
}

bool public_key::verify( const signature& sig, const digest& dig ) const noexcept
{
  return !crypto_sign_verify_detached( memory::pointer_cast< const unsigned char* >( sig.data() ),
                                       memory::pointer_cast< const unsigned char* >( dig.data() ),
                                       dig.size(),
                                       memory::pointer_cast< const unsigned char* >( _bytes.data() ) );
}

public_key_span public_key::bytes() const noexcept
{
  return _bytes;
}

} // namespace mutual::crypto
