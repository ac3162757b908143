#pragma once

#include <system_error>

#include <mutual/ledger/error.hpp>
#include <mutual/ledger/types.hpp>
#include <mutual/program/system_interface.hpp>

namespace mutual::ledger::guard {

// The record slot must be owned by the executing program.
std::error_code check_ownership( program::system_interface* system, protocol::account_view record );

// The account must have signed the current invocation.
std::error_code check_signer( program::system_interface* system, protocol::account_view account );

// Signer check followed by equality with the stored admin.
std::error_code
check_admin( program::system_interface* system, const aggregate& state, protocol::account_view account );

} // namespace mutual::ledger::guard
