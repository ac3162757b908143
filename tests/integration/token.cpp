// NOLINTBEGIN

#include <cstdint>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include <mutual/ledger.hpp>
#include <mutual/memory.hpp>
#include <mutual/program.hpp>
#include <test/fixture.hpp>

using namespace mutual;
using instruction = program::token::instruction;

class token_program: public ::testing::Test,
                     public test::fixture
{
public:
  token_program():
      test::fixture( "token_program", "debug" ),
      alice_secret_key( crypto::secret_key::create( crypto::hash( "alice" ) ) ),
      bob_secret_key( crypto::secret_key::create( crypto::hash( "bob" ) ) ),
      alice( account_of( alice_secret_key ) ),
      bob( account_of( bob_secret_key ) )
  {
    initialize_ledger();
  }

  token_program( const token_program& ) = delete;
  token_program( token_program&& )      = delete;

  ~token_program() override = default;

  token_program& operator=( const token_program& ) = delete;
  token_program& operator=( token_program&& )      = delete;

  std::uint64_t read_u64( const std::vector< std::byte >& bytes )
  {
    return boost::endian::little_to_native( memory::bit_cast< std::uint64_t >( bytes ) );
  }

  std::uint64_t total_supply()
  {
    auto output = call_token( make_stdin( instruction::total_supply ), {} );
    EXPECT_TRUE( output );
    return output ? read_u64( output->stdout ) : 0;
  }

  // Supply only enters through the ledger.
  auto mint( const protocol::account& to, std::uint64_t amount )
  {
    return apply( ledger::instructions::mint{ .amount = amount }, { alice, to }, { &alice_secret_key } );
  }

  crypto::secret_key alice_secret_key;
  crypto::secret_key bob_secret_key;

  protocol::account alice;
  protocol::account bob;
};

TEST_F( token_program, metadata )
{
  auto name = call_token( make_stdin( instruction::name ), {} );
  ASSERT_TRUE( name );
  EXPECT_EQ( memory::as_string_view( name->stdout ), "Mutual" );

  auto symbol = call_token( make_stdin( instruction::symbol ), {} );
  ASSERT_TRUE( symbol );
  EXPECT_EQ( memory::as_string_view( symbol->stdout ), "MUT" );

  auto decimals = call_token( make_stdin( instruction::decimals ), {} );
  ASSERT_TRUE( decimals );
  ASSERT_EQ( decimals->stdout.size(), sizeof( std::uint32_t ) );
  EXPECT_EQ( boost::endian::little_to_native( memory::bit_cast< std::uint32_t >( decimals->stdout ) ), 8 );

  EXPECT_EQ( total_supply(), 0 );
  EXPECT_EQ( balance_of( alice ), 0 );
}

TEST_F( token_program, mint )
{
  auto unsigned_mint = call_token( make_stdin( instruction::mint, alice, bob, std::uint64_t( 100 ) ), {} );
  ASSERT_FALSE( unsigned_mint );
  EXPECT_EQ( unsigned_mint.error(), program::program_errc::unauthorized );

  // A signature is not enough outside the ledger.
  auto direct_mint =
    call_token( make_stdin( instruction::mint, alice, bob, std::uint64_t( 100 ) ), { &alice_secret_key } );
  ASSERT_FALSE( direct_mint );
  EXPECT_EQ( direct_mint.error(), program::program_errc::unauthorized );
  EXPECT_EQ( balance_of( bob ), 0 );
  EXPECT_EQ( total_supply(), 0 );

  ASSERT_TRUE( mint( bob, 100 ) );
  EXPECT_EQ( balance_of( bob ), 100 );
  EXPECT_EQ( balance_of( alice ), 0 );
  EXPECT_EQ( total_supply(), 100 );
  EXPECT_EQ( state().token_management->total_supply, total_supply() );
}

TEST_F( token_program, transfer )
{
  ASSERT_TRUE( mint( alice, 50 ) );

  auto unsigned_transfer = call_token( make_stdin( instruction::transfer, alice, bob, std::uint64_t( 10 ) ), {} );
  ASSERT_FALSE( unsigned_transfer );
  EXPECT_EQ( unsigned_transfer.error(), program::program_errc::unauthorized );

  auto wrong_signer =
    call_token( make_stdin( instruction::transfer, alice, bob, std::uint64_t( 10 ) ), { &bob_secret_key } );
  ASSERT_FALSE( wrong_signer );
  EXPECT_EQ( wrong_signer.error(), program::program_errc::unauthorized );

  auto too_much =
    call_token( make_stdin( instruction::transfer, alice, bob, std::uint64_t( 51 ) ), { &alice_secret_key } );
  ASSERT_FALSE( too_much );
  EXPECT_EQ( too_much.error(), program::program_errc::insufficient_balance );

  auto to_self =
    call_token( make_stdin( instruction::transfer, alice, alice, std::uint64_t( 1 ) ), { &alice_secret_key } );
  ASSERT_FALSE( to_self );
  EXPECT_EQ( to_self.error(), program::program_errc::invalid_argument );

  ASSERT_TRUE(
    call_token( make_stdin( instruction::transfer, alice, bob, std::uint64_t( 20 ) ), { &alice_secret_key } ) );
  EXPECT_EQ( balance_of( alice ), 30 );
  EXPECT_EQ( balance_of( bob ), 20 );
  EXPECT_EQ( total_supply(), 50 );
}

TEST_F( token_program, burn )
{
  ASSERT_TRUE( mint( alice, 50 ) );
  ASSERT_TRUE( mint( bob, 50 ) );

  auto unsigned_burn = call_token( make_stdin( instruction::burn, alice, std::uint64_t( 10 ) ), {} );
  ASSERT_FALSE( unsigned_burn );
  EXPECT_EQ( unsigned_burn.error(), program::program_errc::unauthorized );

  auto direct_burn = call_token( make_stdin( instruction::burn, alice, std::uint64_t( 10 ) ), { &alice_secret_key } );
  ASSERT_FALSE( direct_burn );
  EXPECT_EQ( direct_burn.error(), program::program_errc::unauthorized );

  auto burn = [ & ]( std::uint64_t amount )
  {
    return apply( ledger::instructions::burn{ .amount = amount },
                  { alice, program::token_program_id(), alice },
                  { &alice_secret_key } );
  };

  auto too_much = burn( 51 );
  ASSERT_FALSE( too_much );
  EXPECT_EQ( too_much.error(), program::program_errc::insufficient_balance );

  ASSERT_TRUE( burn( 15 ) );
  EXPECT_EQ( balance_of( alice ), 35 );
  EXPECT_EQ( total_supply(), 85 );
  EXPECT_EQ( state().token_management->total_supply, 85 );
}

TEST_F( token_program, unexpected_object )
{
  ASSERT_TRUE( mint( alice, 50 ) );

  // Balance id 1 keyed by account, supply id 0 with an empty key.
  _store.put_object( program::token_program_id(), 1, bob, std::vector< std::byte >( 3, std::byte{ 0x01 } ) );

  auto balance = call_token( make_stdin( instruction::balance_of, bob ), {} );
  ASSERT_FALSE( balance );
  EXPECT_EQ( balance.error(), program::program_errc::unexpected_object );

  auto transfer =
    call_token( make_stdin( instruction::transfer, alice, bob, std::uint64_t( 5 ) ), { &alice_secret_key } );
  ASSERT_FALSE( transfer );
  EXPECT_EQ( transfer.error(), program::program_errc::unexpected_object );
  EXPECT_EQ( balance_of( alice ), 50 );

  _store.put_object( program::token_program_id(), 0, {}, std::vector< std::byte >( 9, std::byte{ 0x01 } ) );

  auto supply = call_token( make_stdin( instruction::total_supply ), {} );
  ASSERT_FALSE( supply );
  EXPECT_EQ( supply.error(), program::program_errc::unexpected_object );
}

TEST_F( token_program, malformed_input )
{
  auto empty = call_token( {}, {} );
  ASSERT_FALSE( empty );
  EXPECT_EQ( empty.error(), program::program_errc::invalid_instruction );

  auto unknown = call_token( make_stdin( std::uint32_t( 99 ) ), {} );
  ASSERT_FALSE( unknown );
  EXPECT_EQ( unknown.error(), program::program_errc::invalid_instruction );

  auto truncated = call_token( make_stdin( instruction::transfer, alice ), { &alice_secret_key } );
  ASSERT_FALSE( truncated );
  EXPECT_EQ( truncated.error(), program::program_errc::invalid_argument );
}

// NOLINTEND
