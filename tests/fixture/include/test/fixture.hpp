#pragma once

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/endian.hpp>

#include <mutual/crypto.hpp>
#include <mutual/host.hpp>
#include <mutual/ledger.hpp>
#include <mutual/memory.hpp>
#include <mutual/program.hpp>
#include <mutual/protocol.hpp>

namespace test {

// Default slot size for ledger records created by the fixture.
constexpr std::size_t record_capacity = 4'096;

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture() = default;

  static mutual::protocol::account account_of( const mutual::crypto::secret_key& key );

  mutual::protocol::transaction make_transaction( const mutual::protocol::account& program,
                                                  std::vector< mutual::protocol::account > accounts,
                                                  std::vector< std::byte > data,
                                                  std::initializer_list< const mutual::crypto::secret_key* > signers );

  // Runs one ledger instruction against the record; account [0] is filled in with the record.
  mutual::host::result< mutual::protocol::program_output >
  apply( const mutual::ledger::instruction& instruction,
         std::vector< mutual::protocol::account > accounts,
         std::initializer_list< const mutual::crypto::secret_key* > signers,
         std::int64_t time = 0 );

  mutual::host::result< mutual::protocol::program_output >
  call_token( std::vector< std::byte > stdin, std::initializer_list< const mutual::crypto::secret_key* > signers );

  // Initializes the record with the admin key, treasury key and token support.
  void initialize_ledger();

  // Creates an account owned by nobody whose data is exactly the given bytes.
  void create_data_account( const mutual::protocol::account& id, std::vector< std::byte > data );

  mutual::ledger::aggregate state() const;
  std::vector< std::byte > record_bytes() const;
  std::uint64_t balance_of( const mutual::protocol::account& account );

  template< std::integral T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    boost::endian::native_to_little_inplace( t );
    const auto bytes = mutual::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< typename T >
    requires std::is_enum_v< T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    return append_stdin( input, std::to_underlying( t ) );
  }

  void append_stdin( std::vector< std::byte >& input, const mutual::protocol::account& a ) const noexcept
  {
    input.insert( input.end(), a.begin(), a.end() );
  }

  template< typename... Args >
  std::vector< std::byte > make_stdin( Args... args ) const noexcept
  {
    std::vector< std::byte > input;
    ( ( append_stdin( input, std::forward< Args >( args ) ) ), ... );
    return input;
  }

  mutual::host::store _store;
  std::unique_ptr< mutual::host::context > _context;
  std::uint64_t _nonce = 0;

  mutual::crypto::secret_key _admin_secret_key;
  mutual::crypto::secret_key _treasury_secret_key;
  mutual::protocol::account _record;
};

} // namespace test
