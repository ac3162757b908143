#include <mutual/ledger/disputes.hpp>

#include <algorithm>
#include <utility>

namespace mutual::ledger::disputes {

result< dispute > submit( aggregate& state,
                          const identity& initiator,
                          const identity& respondent,
                          std::optional< std::uint64_t > claim_id,
                          std::string description )
{
  if( claim_id && *claim_id >= state.claims.size() )
    return std::unexpected( ledger_errc::not_found );

  return state.disputes.emplace_back( dispute{ .id          = state.disputes.size(),
                                               .claim_id    = claim_id,
                                               .initiator   = initiator,
                                               .respondent  = respondent,
                                               .description = std::move( description ),
                                               .status      = dispute_status::open,
                                               .votes       = {} } );
}

std::error_code vote( aggregate& state, std::uint64_t index, const identity& voter, bool support )
{
  if( index >= state.disputes.size() )
    return ledger_errc::not_found;

  auto& d = state.disputes[ index ];

  if( d.status != dispute_status::open )
    return ledger_errc::invalid_state;

  if( std::ranges::contains( d.votes, voter, &dispute_vote::voter ) )
    return ledger_errc::validation_error;

  d.votes.emplace_back( dispute_vote{ .voter = voter, .support = support } );

  if( d.votes.size() > dispute_vote_threshold )
  {
    auto in_favour = static_cast< std::size_t >( std::ranges::count( d.votes, true, &dispute_vote::support ) );
    d.status       = in_favour * 2 > d.votes.size() ? dispute_status::upheld : dispute_status::dismissed;
  }

  return ledger_errc::ok;
}

} // namespace mutual::ledger::disputes
