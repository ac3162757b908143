#pragma once

#include <cstdint>
#include <system_error>

#include <mutual/ledger/error.hpp>
#include <mutual/ledger/types.hpp>

namespace mutual::ledger::administration {

// Claims a zero-filled record. Fails once the record has an admin.
std::error_code initialize( aggregate& state, const identity& admin, const identity& treasury, bool token_support );

void update_regulatory_parameter( aggregate& state, std::uint64_t limit ) noexcept;

} // namespace mutual::ledger::administration
