#include <algorithm>
#include <limits>
#include <string_view>
#include <utility>

#include <boost/endian.hpp>

#include <mutual/memory.hpp>
#include <mutual/program/token.hpp>
#include <mutual/protocol.hpp>

namespace mutual::program {

static constexpr std::string_view name   = "Mutual";
static constexpr std::string_view symbol = "MUT";
static constexpr std::uint32_t decimals  = 8;

static constexpr std::uint32_t supply_id  = 0;
static constexpr std::uint32_t balance_id = 1;

protocol::account token_program_id() noexcept
{
  return protocol::system_program( "token" );
}

token::token( protocol::account minter ) noexcept:
    _minter( minter )
{}

result< std::uint64_t > token::total_supply( system_interface* system )
{
  auto object = system->get_object( supply_id, std::span< const std::byte >{} );
  if( object.empty() )
    return 0;

  if( object.size() != sizeof( std::uint64_t ) )
    return std::unexpected( program_errc::unexpected_object );

  return boost::endian::little_to_native( memory::bit_cast< std::uint64_t >( object ) );
}

result< std::uint64_t > token::balance_of( system_interface* system, std::span< const std::byte > account )
{
  auto object = system->get_object( balance_id, account );
  if( object.empty() )
    return 0;

  if( object.size() != sizeof( std::uint64_t ) )
    return std::unexpected( program_errc::unexpected_object );

  return boost::endian::little_to_native( memory::bit_cast< std::uint64_t >( object ) );
}

std::error_code token::run( system_interface* system )
{
  std::uint32_t selector = 0;
  if( auto error = system->read( file_descriptor::stdin, memory::as_writable_bytes( selector ) ); error )
    return program_errc::invalid_instruction;

  boost::endian::little_to_native_inplace( selector );

  auto read_value = [ & ]( auto& value ) -> std::error_code
  {
    if( system->read( file_descriptor::stdin, memory::as_writable_bytes( value ) ) )
      return program_errc::invalid_argument;

    boost::endian::little_to_native_inplace( value );
    return {};
  };

  auto read_account = [ & ]( protocol::account& account ) -> std::error_code
  {
    if( system->read( file_descriptor::stdin, memory::as_writable_bytes( account ) ) )
      return program_errc::invalid_argument;

    return {};
  };

  switch( selector )
  {
    case std::to_underlying( instruction::name ):
      return system->write( file_descriptor::stdout, memory::as_bytes( name ) );
    case std::to_underlying( instruction::symbol ):
      return system->write( file_descriptor::stdout, memory::as_bytes( symbol ) );
    case std::to_underlying( instruction::decimals ):
      {
        auto dec = boost::endian::native_to_little( decimals );
        return system->write( file_descriptor::stdout, memory::as_bytes( dec ) );
      }
    case std::to_underlying( instruction::total_supply ):
      {
        auto supply = total_supply( system );
        if( !supply )
          return supply.error();

        boost::endian::native_to_little_inplace( *supply );
        return system->write( file_descriptor::stdout, memory::as_bytes( *supply ) );
      }
    case std::to_underlying( instruction::balance_of ):
      {
        protocol::account account;
        if( auto error = read_account( account ); error )
          return error;

        auto balance = balance_of( system, account );
        if( !balance )
          return balance.error();

        boost::endian::native_to_little_inplace( *balance );
        return system->write( file_descriptor::stdout, memory::as_bytes( *balance ) );
      }
    case std::to_underlying( instruction::transfer ):
      {
        protocol::account from;
        protocol::account to;
        std::uint64_t value = 0;

        if( auto error = read_account( from ); error )
          return error;
        if( auto error = read_account( to ); error )
          return error;
        if( auto error = read_value( value ); error )
          return error;

        if( from == to )
          return program_errc::invalid_argument;

        if( !std::ranges::equal( from, system->get_caller() ) )
        {
          auto authorized = system->check_authority( from );
          if( !authorized )
            return authorized.error();
          if( !*authorized )
            return program_errc::unauthorized;
        }

        auto from_balance = balance_of( system, from );
        if( !from_balance )
          return from_balance.error();

        if( *from_balance < value )
          return program_errc::insufficient_balance;

        auto to_balance = balance_of( system, to );
        if( !to_balance )
          return to_balance.error();

        if( std::numeric_limits< std::uint64_t >::max() - value < *to_balance )
          return program_errc::overflow;

        *from_balance -= value;
        *to_balance   += value;

        boost::endian::native_to_little_inplace( *from_balance );
        boost::endian::native_to_little_inplace( *to_balance );

        if( auto error = system->put_object( balance_id, from, memory::as_bytes( *from_balance ) ); error )
          return error;

        return system->put_object( balance_id, to, memory::as_bytes( *to_balance ) );
      }
    case std::to_underlying( instruction::mint ):
      {
        protocol::account authority;
        protocol::account to;
        std::uint64_t value = 0;

        if( auto error = read_account( authority ); error )
          return error;
        if( auto error = read_account( to ); error )
          return error;
        if( auto error = read_value( value ); error )
          return error;

        if( !std::ranges::equal( _minter, system->get_caller() ) )
          return program_errc::unauthorized;

        auto authorized = system->check_authority( authority );
        if( !authorized )
          return authorized.error();
        if( !*authorized )
          return program_errc::unauthorized;

        auto supply = total_supply( system );
        if( !supply )
          return supply.error();

        if( std::numeric_limits< std::uint64_t >::max() - value < *supply )
          return program_errc::overflow;

        auto to_balance = balance_of( system, to );
        if( !to_balance )
          return to_balance.error();

        *supply     += value;
        *to_balance += value;

        boost::endian::native_to_little_inplace( *supply );
        boost::endian::native_to_little_inplace( *to_balance );

        if( auto error = system->put_object( supply_id, std::span< const std::byte >{}, memory::as_bytes( *supply ) );
            error )
          return error;

        return system->put_object( balance_id, to, memory::as_bytes( *to_balance ) );
      }
    case std::to_underlying( instruction::burn ):
      {
        protocol::account from;
        std::uint64_t value = 0;

        if( auto error = read_account( from ); error )
          return error;
        if( auto error = read_value( value ); error )
          return error;

        if( !std::ranges::equal( _minter, system->get_caller() ) )
          return program_errc::unauthorized;

        auto authorized = system->check_authority( from );
        if( !authorized )
          return authorized.error();
        if( !*authorized )
          return program_errc::unauthorized;

        auto from_balance = balance_of( system, from );
        if( !from_balance )
          return from_balance.error();

        if( *from_balance < value )
          return program_errc::insufficient_balance;

        auto supply = total_supply( system );
        if( !supply )
          return supply.error();

        if( value > *supply )
          return program_errc::insufficient_supply;

        *supply       -= value;
        *from_balance -= value;

        boost::endian::native_to_little_inplace( *supply );
        boost::endian::native_to_little_inplace( *from_balance );

        if( auto error = system->put_object( supply_id, std::span< const std::byte >{}, memory::as_bytes( *supply ) );
            error )
          return error;

        return system->put_object( balance_id, from, memory::as_bytes( *from_balance ) );
      }
    default:
      return program_errc::invalid_instruction;
  }
}

} // namespace mutual::program
