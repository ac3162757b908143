#include <mutual/ledger/membership.hpp>

#include <algorithm>

namespace mutual::ledger::membership {

const member& join( aggregate& state, const identity& address, timestamp now )
{
  return state.members.emplace_back( member{ .address = address, .joined_at = now } );
}

bool is_member( const aggregate& state, const identity& address ) noexcept
{
  return std::ranges::any_of( state.members,
                              [ & ]( const member& m )
                              {
                                return m.address == address;
                              } );
}

} // namespace mutual::ledger::membership
