// NOLINTBEGIN

#include <test/fixture.hpp>

#include <stdexcept>

#include <mutual/log.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level ):
    _context( std::make_unique< mutual::host::context >( _store ) ),
    _admin_secret_key( mutual::crypto::secret_key::create( mutual::crypto::hash( "admin" ) ) ),
    _treasury_secret_key( mutual::crypto::secret_key::create( mutual::crypto::hash( "treasury" ) ) ),
    _record( mutual::protocol::system_program( name ) )
{
  mutual::log::initialize( log_level );

  if( _store.create_account( _record, mutual::ledger::ledger_program_id(), record_capacity ) )
    throw std::runtime_error( "unable to create ledger record" );

  LOG_INFO( mutual::log::instance(), "Using ledger record: {}", mutual::log::hex{ _record.data(), _record.size() } );
}

mutual::protocol::account fixture::account_of( const mutual::crypto::secret_key& key )
{
  return mutual::protocol::user_account( key.public_key() );
}

mutual::protocol::transaction
fixture::make_transaction( const mutual::protocol::account& program,
                           std::vector< mutual::protocol::account > accounts,
                           std::vector< std::byte > data,
                           std::initializer_list< const mutual::crypto::secret_key* > signers )
{
  mutual::protocol::transaction t;
  t.nonce                = ++_nonce;
  t.instruction.program  = program;
  t.instruction.accounts = std::move( accounts );
  t.instruction.data     = std::move( data );
  t.id                   = mutual::protocol::make_id( t );

  for( const auto* signer: signers )
  {
    mutual::protocol::authorization auth;
    auth.signer    = account_of( *signer );
    auth.signature = signer->sign( t.id );
    t.authorizations.emplace_back( auth );
  }

  return t;
}

mutual::host::result< mutual::protocol::program_output >
fixture::apply( const mutual::ledger::instruction& instruction,
                std::vector< mutual::protocol::account > accounts,
                std::initializer_list< const mutual::crypto::secret_key* > signers,
                std::int64_t time )
{
  accounts.insert( accounts.begin(), _record );

  _context->set_time( time );
  return _context->execute( make_transaction( mutual::ledger::ledger_program_id(),
                                              std::move( accounts ),
                                              mutual::ledger::encode_instruction( instruction ),
                                              signers ) );
}

mutual::host::result< mutual::protocol::program_output >
fixture::call_token( std::vector< std::byte > stdin,
                     std::initializer_list< const mutual::crypto::secret_key* > signers )
{
  return _context->execute( make_transaction( mutual::program::token_program_id(), {}, std::move( stdin ), signers ) );
}

void fixture::initialize_ledger()
{
  auto result = apply( mutual::ledger::instructions::initialize{ .token_support = true },
                       { account_of( _admin_secret_key ), account_of( _treasury_secret_key ) },
                       { &_admin_secret_key } );

  if( !result )
    throw std::runtime_error( "unable to initialize ledger: " + result.error().message() );
}

void fixture::create_data_account( const mutual::protocol::account& id, std::vector< std::byte > data )
{
  if( _store.create_account( id, mutual::protocol::account{}, data.size() ) )
    throw std::runtime_error( "unable to create data account" );

  _store.find_account( id )->data = std::move( data );
}

mutual::ledger::aggregate fixture::state() const
{
  auto state = mutual::ledger::codec::decode( record_bytes() );
  if( !state )
    throw std::runtime_error( "unable to decode ledger record: " + state.error().message() );

  return *state;
}

std::vector< std::byte > fixture::record_bytes() const
{
  return _store.find_account( _record )->data;
}

std::uint64_t fixture::balance_of( const mutual::protocol::account& account )
{
  auto output = call_token( make_stdin( mutual::program::token::instruction::balance_of, account ), {} );
  if( !output )
    throw std::runtime_error( "unable to read balance: " + output.error().message() );

  return boost::endian::little_to_native( mutual::memory::bit_cast< std::uint64_t >( output->stdout ) );
}

} // namespace test

// NOLINTEND
