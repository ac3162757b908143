#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <system_error>

#include <mutual/ledger/error.hpp>
#include <mutual/ledger/types.hpp>

namespace mutual::ledger::governance {

using weight_source = std::function< result< std::uint64_t >() >;

// Opens an Active proposal whose window is [now, now + duration].
result< proposal > create_proposal( aggregate& state,
                                    const identity& proposer,
                                    std::string description,
                                    std::int64_t duration,
                                    timestamp now );

// Adds the weight to the chosen tally. The weight is only looked up once the proposal is known to accept
// votes. Repeated votes by the same voter are counted again.
std::error_code
vote( aggregate& state, std::uint64_t index, vote_choice choice, const weight_source& weight, timestamp now );

std::error_code finalize( aggregate& state, std::uint64_t index, timestamp now );

// Passed when yes outweighs no, Rejected otherwise.
proposal_status outcome( const proposal& p ) noexcept;

} // namespace mutual::ledger::governance
