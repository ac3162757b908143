// NOLINTBEGIN

#include <gtest/gtest.h>

#include <cstdint>
#include <system_error>
#include <utility>
#include <vector>

#include <mutual/ledger/claims.hpp>
#include <mutual/protocol/account.hpp>

using namespace mutual;
using ledger::ledger_errc;

TEST( claims, submit )
{
  ledger::aggregate state;
  auto alice = protocol::system_program( "alice" );

  const auto& first = ledger::claims::submit( state, alice );
  EXPECT_EQ( first.id, 0 );
  EXPECT_EQ( first.member, alice );
  EXPECT_EQ( first.amount, ledger::claim_placeholder_amount );
  EXPECT_FALSE( first.verified );

  // Claims are accepted from non-members.
  EXPECT_TRUE( state.members.empty() );

  EXPECT_EQ( ledger::claims::submit( state, alice ).id, 1 );
}

TEST( claims, verify )
{
  ledger::aggregate state;
  ledger::claims::submit( state, protocol::system_program( "alice" ) );

  std::vector< std::byte > approve{ std::byte{ 0x01 }, std::byte{ 0x7f } };
  std::vector< std::byte > deny{ std::byte{ 0x02 } };

  EXPECT_FALSE( ledger::claims::verify( state, 0, approve ) );
  EXPECT_TRUE( state.claims[ 0 ].verified );

  EXPECT_FALSE( ledger::claims::verify( state, 0, deny ) );
  EXPECT_FALSE( state.claims[ 0 ].verified );

  EXPECT_FALSE( ledger::claims::verify( state, 0, approve ) );
  EXPECT_FALSE( ledger::claims::verify( state, 0, {} ) );
  EXPECT_FALSE( state.claims[ 0 ].verified );

  EXPECT_EQ( ledger::claims::verify( state, 1, approve ), ledger_errc::not_found );
}

TEST( claims, pay )
{
  auto alice = protocol::system_program( "alice" );
  auto bob   = protocol::system_program( "bob" );

  ledger::aggregate state;
  state.regulatory_limit = ledger::claim_placeholder_amount;
  ledger::claims::submit( state, alice );
  ledger::claims::submit( state, alice );

  std::vector< std::pair< ledger::identity, std::uint64_t > > transfers;
  auto record = [ & ]( const ledger::identity& recipient, std::uint64_t amount ) -> std::error_code
  {
    transfers.emplace_back( recipient, amount );
    return {};
  };

  EXPECT_EQ( ledger::claims::pay( state, 2, alice, record, 10 ).error(), ledger_errc::not_found );

  // Unverified
  EXPECT_EQ( ledger::claims::pay( state, 0, alice, record, 10 ).error(), ledger_errc::validation_error );

  state.claims[ 0 ].verified = true;

  // Only the claimant is paid.
  EXPECT_EQ( ledger::claims::pay( state, 0, bob, record, 10 ).error(), ledger_errc::validation_error );
  EXPECT_TRUE( transfers.empty() );

  auto paid = ledger::claims::pay( state, 0, alice, record, 10 );
  ASSERT_TRUE( paid );
  EXPECT_EQ( paid->claim_id, 0 );
  EXPECT_EQ( paid->recipient, alice );
  EXPECT_EQ( paid->amount, ledger::claim_placeholder_amount );
  EXPECT_EQ( paid->paid_at, 10 );
  ASSERT_EQ( state.payouts.size(), 1 );
  ASSERT_EQ( transfers.size(), 1 );
  EXPECT_EQ( transfers[ 0 ].second, ledger::claim_placeholder_amount );

  EXPECT_EQ( ledger::claims::pay( state, 0, alice, record, 11 ).error(), ledger_errc::invalid_state );
  EXPECT_EQ( transfers.size(), 1 );

  // Above the regulatory limit
  state.claims[ 1 ].verified = true;
  state.regulatory_limit     = ledger::claim_placeholder_amount - 1;
  EXPECT_EQ( ledger::claims::pay( state, 1, alice, record, 12 ).error(), ledger_errc::validation_error );
  EXPECT_EQ( transfers.size(), 1 );
  EXPECT_EQ( state.payouts.size(), 1 );
}

TEST( claims, failed_disbursement_is_not_recorded )
{
  auto alice = protocol::system_program( "alice" );

  ledger::aggregate state;
  state.regulatory_limit = ledger::claim_placeholder_amount;
  ledger::claims::submit( state, alice );
  state.claims[ 0 ].verified = true;

  auto result = ledger::claims::pay(
    state,
    0,
    alice,
    []( const ledger::identity&, std::uint64_t ) -> std::error_code
    {
      return ledger_errc::arithmetic_error;
    },
    10 );

  ASSERT_FALSE( result );
  EXPECT_EQ( result.error(), ledger_errc::arithmetic_error );
  EXPECT_TRUE( state.payouts.empty() );
}

// NOLINTEND
