#include <mutual/ledger/governance.hpp>

#include <limits>
#include <utility>

namespace mutual::ledger::governance {

result< proposal > create_proposal( aggregate& state,
                                    const identity& proposer,
                                    std::string description,
                                    std::int64_t duration,
                                    timestamp now )
{
  if( duration < 0 )
    return std::unexpected( ledger_errc::validation_error );

  if( now > std::numeric_limits< timestamp >::max() - duration )
    return std::unexpected( ledger_errc::arithmetic_error );

  return state.proposals.emplace_back( proposal{ .id          = state.proposals.size(),
                                                 .proposer    = proposer,
                                                 .description = std::move( description ),
                                                 .vote_start  = now,
                                                 .vote_end    = now + duration,
                                                 .yes_votes   = 0,
                                                 .no_votes    = 0,
                                                 .status      = proposal_status::active } );
}

std::error_code
vote( aggregate& state, std::uint64_t index, vote_choice choice, const weight_source& weight, timestamp now )
{
  if( index >= state.proposals.size() )
    return ledger_errc::not_found;

  auto& p = state.proposals[ index ];

  if( p.status != proposal_status::active )
    return ledger_errc::validation_error;

  if( now < p.vote_start || now > p.vote_end )
    return ledger_errc::validation_error;

  auto amount = weight();
  if( !amount )
    return amount.error();

  auto& tally = choice == vote_choice::yes ? p.yes_votes : p.no_votes;

  if( std::numeric_limits< std::uint64_t >::max() - *amount < tally )
    return ledger_errc::arithmetic_error;

  tally += *amount;

  return ledger_errc::ok;
}

std::error_code finalize( aggregate& state, std::uint64_t index, timestamp now )
{
  if( index >= state.proposals.size() )
    return ledger_errc::not_found;

  auto& p = state.proposals[ index ];

  if( now <= p.vote_end )
    return ledger_errc::validation_error;

  if( p.status != proposal_status::active )
    return ledger_errc::invalid_state;

  p.status = outcome( p );

  return ledger_errc::ok;
}

proposal_status outcome( const proposal& p ) noexcept
{
  return p.yes_votes > p.no_votes ? proposal_status::passed : proposal_status::rejected;
}

} // namespace mutual::ledger::governance
