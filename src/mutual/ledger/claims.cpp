#include <mutual/ledger/claims.hpp>

#include <algorithm>

namespace mutual::ledger::claims {

const claim& submit( aggregate& state, const identity& claimant )
{
  return state.claims.emplace_back( claim{ .id       = state.claims.size(),
                                           .member   = claimant,
                                           .amount   = claim_placeholder_amount,
                                           .verified = false } );
}

std::error_code verify( aggregate& state, std::uint64_t index, std::span< const std::byte > oracle_data )
{
  if( index >= state.claims.size() )
    return ledger_errc::not_found;

  state.claims[ index ].verified = !oracle_data.empty() && oracle_data.front() == std::byte{ 0x01 };

  return ledger_errc::ok;
}

result< payout > pay( aggregate& state,
                      std::uint64_t index,
                      const identity& recipient,
                      const disbursement& disburse,
                      timestamp now )
{
  if( index >= state.claims.size() )
    return std::unexpected( ledger_errc::not_found );

  const auto& c = state.claims[ index ];

  if( !c.verified || c.member != recipient )
    return std::unexpected( ledger_errc::validation_error );

  if( std::ranges::any_of( state.payouts,
                           [ & ]( const payout& p )
                           {
                             return p.claim_id == c.id;
                           } ) )
    return std::unexpected( ledger_errc::invalid_state );

  if( c.amount > state.regulatory_limit )
    return std::unexpected( ledger_errc::validation_error );

  if( auto error = disburse( recipient, c.amount ); error )
    return std::unexpected( error );

  return state.payouts.emplace_back(
    payout{ .claim_id = c.id, .recipient = recipient, .amount = c.amount, .paid_at = now } );
}

} // namespace mutual::ledger::claims
