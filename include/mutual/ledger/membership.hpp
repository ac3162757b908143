#pragma once

#include <mutual/ledger/types.hpp>

namespace mutual::ledger::membership {

// Enrollment never fails and performs no uniqueness check.
const member& join( aggregate& state, const identity& address, timestamp now );

bool is_member( const aggregate& state, const identity& address ) noexcept;

} // namespace mutual::ledger::membership
