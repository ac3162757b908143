#include <mutual/ledger/administration.hpp>

namespace mutual::ledger::administration {

std::error_code initialize( aggregate& state, const identity& admin, const identity& treasury, bool token_support )
{
  if( state.initialized() )
    return ledger_errc::invalid_state;

  if( admin.null() )
    return ledger_errc::validation_error;

  state.admin    = admin;
  state.treasury = treasury;

  if( token_support )
    state.token_management = token_management{ .total_supply = 0 };

  return ledger_errc::ok;
}

void update_regulatory_parameter( aggregate& state, std::uint64_t limit ) noexcept
{
  state.regulatory_limit = limit;
}

} // namespace mutual::ledger::administration
