#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <system_error>

#include <mutual/ledger/error.hpp>
#include <mutual/ledger/types.hpp>

namespace mutual::ledger::claims {

const claim& submit( aggregate& state, const identity& claimant );

// Writes the oracle's verdict: verified when the first byte of its data is 1.
std::error_code verify( aggregate& state, std::uint64_t index, std::span< const std::byte > oracle_data );

using disbursement = std::function< std::error_code( const identity& recipient, std::uint64_t amount ) >;

// Settles a verified claim with its claimant, at most once and never above the regulatory limit.
// The disbursement runs after every check has passed.
result< payout > pay( aggregate& state,
                      std::uint64_t index,
                      const identity& recipient,
                      const disbursement& disburse,
                      timestamp now );

} // namespace mutual::ledger::claims
