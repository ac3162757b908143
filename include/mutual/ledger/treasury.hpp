#pragma once

#include <cstdint>
#include <system_error>

#include <mutual/ledger/error.hpp>
#include <mutual/ledger/types.hpp>
#include <mutual/program/system_interface.hpp>

namespace mutual::ledger::treasury {

// Supply-tracked operations. Failures reported by the token program are returned unchanged.
std::error_code mint( program::system_interface* system,
                      aggregate& state,
                      protocol::account_view authority,
                      protocol::account_view destination,
                      std::uint64_t amount );

std::error_code transfer( program::system_interface* system,
                          protocol::account_view source,
                          protocol::account_view destination,
                          std::uint64_t amount );

std::error_code burn( program::system_interface* system,
                      aggregate& state,
                      protocol::account_view token_account,
                      protocol::account_view mint,
                      std::uint64_t amount );

// Moves the premium from the payer to the treasury identity stored in the record.
std::error_code pay_premium( program::system_interface* system,
                             const aggregate& state,
                             protocol::account_view payer,
                             std::uint64_t amount );

// Moves funds from the treasury to the recipient. The treasury must have signed the invocation.
std::error_code disburse( program::system_interface* system,
                          const aggregate& state,
                          protocol::account_view recipient,
                          std::uint64_t amount );

result< std::uint64_t > balance_of( program::system_interface* system, protocol::account_view account );

} // namespace mutual::ledger::treasury
