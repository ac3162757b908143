#include <mutual/ledger/compliance.hpp>

#include <algorithm>

namespace mutual::ledger::compliance {

namespace {

member_compliance* find_mutable( aggregate& state, const identity& member ) noexcept
{
  auto itr = std::ranges::find( state.member_compliance, member, &member_compliance::member );
  return itr == state.member_compliance.end() ? nullptr : &*itr;
}

compliance_status to_status( bool approved ) noexcept
{
  return approved ? compliance_status::approved : compliance_status::rejected;
}

} // namespace

const member_compliance* find( const aggregate& state, const identity& member ) noexcept
{
  auto itr = std::ranges::find( state.member_compliance, member, &member_compliance::member );
  return itr == state.member_compliance.end() ? nullptr : &*itr;
}

void submit_documents( aggregate& state, const identity& member )
{
  if( auto record = find_mutable( state, member ); record )
  {
    record->kyc_status = compliance_status::pending;
    record->aml_status = compliance_status::pending;
    return;
  }

  state.member_compliance.emplace_back( member_compliance{ .member     = member,
                                                           .kyc_status = compliance_status::pending,
                                                           .aml_status = compliance_status::pending } );
}

std::error_code update_status( aggregate& state, const identity& member, bool kyc_approved, bool aml_approved )
{
  auto record = find_mutable( state, member );
  if( !record )
    return ledger_errc::not_found;

  record->kyc_status = to_status( kyc_approved );
  record->aml_status = to_status( aml_approved );

  return ledger_errc::ok;
}

std::error_code check_gate( const aggregate& state, const identity& member )
{
  auto record = find( state, member );
  if( !record )
    return ledger_errc::not_found;

  if( record->kyc_status != compliance_status::approved || record->aml_status != compliance_status::approved )
    return ledger_errc::compliance_error;

  return ledger_errc::ok;
}

} // namespace mutual::ledger::compliance
