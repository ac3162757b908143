#include <mutual/ledger/treasury.hpp>

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

#include <boost/endian.hpp>

#include <mutual/memory.hpp>
#include <mutual/program/token.hpp>

namespace mutual::ledger::treasury {

namespace {

class token_call
{
public:
  explicit token_call( program::token::instruction selector )
  {
    append( boost::endian::native_to_little( std::to_underlying( selector ) ) );
  }

  token_call& account( protocol::account_view a )
  {
    _input.insert( _input.end(), a.begin(), a.end() );
    return *this;
  }

  token_call& value( std::uint64_t v )
  {
    append( boost::endian::native_to_little( v ) );
    return *this;
  }

  result< protocol::program_output > invoke( program::system_interface* system ) const
  {
    return system->call_program( program::token_program_id(), _input );
  }

private:
  template< typename T >
  void append( T t )
  {
    auto bytes = memory::as_bytes( t );
    _input.insert( _input.end(), bytes.begin(), bytes.end() );
  }

  std::vector< std::byte > _input;
};

} // namespace

std::error_code mint( program::system_interface* system,
                      aggregate& state,
                      protocol::account_view authority,
                      protocol::account_view destination,
                      std::uint64_t amount )
{
  if( !state.token_management )
    return ledger_errc::invalid_state;

  auto& supply = state.token_management->total_supply;

  if( std::numeric_limits< std::uint64_t >::max() - amount < supply )
    return ledger_errc::arithmetic_error;

  auto output =
    token_call( program::token::instruction::mint ).account( authority ).account( destination ).value( amount ).invoke(
      system );
  if( !output )
    return output.error();

  supply += amount;

  return ledger_errc::ok;
}

std::error_code transfer( program::system_interface* system,
                          protocol::account_view source,
                          protocol::account_view destination,
                          std::uint64_t amount )
{
  auto output = token_call( program::token::instruction::transfer )
                  .account( source )
                  .account( destination )
                  .value( amount )
                  .invoke( system );
  if( !output )
    return output.error();

  return ledger_errc::ok;
}

std::error_code burn( program::system_interface* system,
                      aggregate& state,
                      protocol::account_view token_account,
                      protocol::account_view mint,
                      std::uint64_t amount )
{
  if( !state.token_management )
    return ledger_errc::invalid_state;

  if( !std::ranges::equal( mint, program::token_program_id() ) )
    return ledger_errc::validation_error;

  auto& supply = state.token_management->total_supply;

  if( amount > supply )
    return ledger_errc::arithmetic_error;

  auto output =
    token_call( program::token::instruction::burn ).account( token_account ).value( amount ).invoke( system );
  if( !output )
    return output.error();

  supply -= amount;

  return ledger_errc::ok;
}

std::error_code pay_premium( program::system_interface* system,
                             const aggregate& state,
                             protocol::account_view payer,
                             std::uint64_t amount )
{
  if( !state.token_management )
    return ledger_errc::invalid_state;

  if( !amount )
    return ledger_errc::validation_error;

  return transfer( system, payer, state.treasury, amount );
}

std::error_code disburse( program::system_interface* system,
                          const aggregate& state,
                          protocol::account_view recipient,
                          std::uint64_t amount )
{
  if( !state.token_management )
    return ledger_errc::invalid_state;

  return transfer( system, state.treasury, recipient, amount );
}

result< std::uint64_t > balance_of( program::system_interface* system, protocol::account_view account )
{
  auto output = token_call( program::token::instruction::balance_of ).account( account ).invoke( system );
  if( !output )
    return std::unexpected( output.error() );

  if( output->stdout.size() != sizeof( std::uint64_t ) )
    return std::unexpected( ledger_errc::decode_error );

  return boost::endian::little_to_native( memory::bit_cast< std::uint64_t >( output->stdout ) );
}

} // namespace mutual::ledger::treasury
