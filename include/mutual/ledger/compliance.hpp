#pragma once

#include <system_error>

#include <mutual/ledger/error.hpp>
#include <mutual/ledger/types.hpp>

namespace mutual::ledger::compliance {

// First record held for the member, or nullptr.
const member_compliance* find( const aggregate& state, const identity& member ) noexcept;

// Creates a Pending/Pending record, or resets an existing one to Pending.
void submit_documents( aggregate& state, const identity& member );

std::error_code update_status( aggregate& state, const identity& member, bool kyc_approved, bool aml_approved );

// Succeeds only when both KYC and AML are Approved. Has no side effect.
std::error_code check_gate( const aggregate& state, const identity& member );

} // namespace mutual::ledger::compliance
