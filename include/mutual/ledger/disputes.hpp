#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

#include <mutual/ledger/error.hpp>
#include <mutual/ledger/types.hpp>

namespace mutual::ledger::disputes {

result< dispute > submit( aggregate& state,
                          const identity& initiator,
                          const identity& respondent,
                          std::optional< std::uint64_t > claim_id,
                          std::string description );

// One vote per voter. The dispute closes once it holds more than dispute_vote_threshold votes.
std::error_code vote( aggregate& state, std::uint64_t index, const identity& voter, bool support );

} // namespace mutual::ledger::disputes
