#include <mutual/protocol/transaction.hpp>

namespace mutual::protocol {

bool transaction::validate() const noexcept
{
  if( make_id( *this ) != id )
    return false;

  if( instruction.program.null() )
    return false;

  return true;
}

crypto::digest make_id( const transaction& t ) noexcept
{
  crypto::hasher_reset();

  crypto::hasher_update( t.nonce );
  crypto::hasher_update( t.instruction.program );

  crypto::hasher_update( static_cast< std::uint32_t >( t.instruction.accounts.size() ) );
  for( const auto& account: t.instruction.accounts )
    crypto::hasher_update( account );

  crypto::hasher_update( static_cast< std::uint32_t >( t.instruction.data.size() ) );
  crypto::hasher_update( t.instruction.data );

  return crypto::hasher_finalize();
}

} // namespace mutual::protocol
