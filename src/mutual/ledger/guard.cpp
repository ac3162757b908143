#include <mutual/ledger/guard.hpp>

#include <algorithm>

namespace mutual::ledger::guard {

std::error_code check_ownership( program::system_interface* system, protocol::account_view record )
{
  auto owner = system->get_account_owner( record );
  if( !owner )
    return owner.error();

  if( !std::ranges::equal( *owner, system->get_program_id() ) )
    return ledger_errc::ownership_error;

  return ledger_errc::ok;
}

std::error_code check_signer( program::system_interface* system, protocol::account_view account )
{
  auto authorized = system->check_authority( account );
  if( !authorized )
    return authorized.error();

  if( !*authorized )
    return ledger_errc::missing_signature;

  return ledger_errc::ok;
}

std::error_code
check_admin( program::system_interface* system, const aggregate& state, protocol::account_view account )
{
  if( auto error = check_signer( system, account ); error )
    return error;

  if( !std::ranges::equal( account, state.admin ) )
    return ledger_errc::authorization_error;

  return ledger_errc::ok;
}

} // namespace mutual::ledger::guard
