#include <mutual/ledger/processor.hpp>

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <mutual/ledger/administration.hpp>
#include <mutual/ledger/claims.hpp>
#include <mutual/ledger/codec.hpp>
#include <mutual/ledger/compliance.hpp>
#include <mutual/ledger/disputes.hpp>
#include <mutual/ledger/governance.hpp>
#include <mutual/ledger/guard.hpp>
#include <mutual/ledger/instruction.hpp>
#include <mutual/ledger/membership.hpp>
#include <mutual/ledger/treasury.hpp>
#include <mutual/log.hpp>

namespace mutual::ledger {

namespace {

constexpr std::array< std::string_view, 18 > operation_names{ "join",
                                                              "submit_claim",
                                                              "verify_claim",
                                                              "mint",
                                                              "transfer",
                                                              "burn",
                                                              "create_proposal",
                                                              "vote",
                                                              "submit_documents",
                                                              "update_compliance_status",
                                                              "check_compliance_gate",
                                                              "update_regulatory_parameter",
                                                              "initialize",
                                                              "finalize_proposal",
                                                              "submit_dispute",
                                                              "vote_dispute",
                                                              "pay_premium",
                                                              "payout_claim" };

class dispatcher
{
public:
  dispatcher( program::system_interface* system, aggregate& state ):
      _system( system ),
      _state( state ),
      _accounts( system->accounts() ),
      _now( system->get_time() )
  {}

  std::error_code operator()( const instructions::join& )
  {
    return with_accounts( 1,
                          [ & ]() -> std::error_code
                          {
                            membership::join( _state, account( 1 ), _now );
                            return ledger_errc::ok;
                          } );
  }

  std::error_code operator()( const instructions::submit_claim& )
  {
    return with_accounts( 1,
                          [ & ]() -> std::error_code
                          {
                            claims::submit( _state, account( 1 ) );
                            return ledger_errc::ok;
                          } );
  }

  std::error_code operator()( const instructions::verify_claim& i )
  {
    return with_accounts( 1,
                          [ & ]() -> std::error_code
                          {
                            auto oracle_data = _system->get_account_data( account( 1 ) );
                            if( !oracle_data )
                              return oracle_data.error();

                            return claims::verify( _state, i.claim_index, *oracle_data );
                          } );
  }

  std::error_code operator()( const instructions::mint& i )
  {
    return with_accounts( 2,
                          [ & ]() -> std::error_code
                          {
                            if( auto error = guard::check_signer( _system, account( 1 ) ); error )
                              return error;

                            return treasury::mint( _system, _state, account( 1 ), account( 2 ), i.amount );
                          } );
  }

  std::error_code operator()( const instructions::transfer& i )
  {
    return with_accounts( 3,
                          [ & ]() -> std::error_code
                          {
                            if( auto error = guard::check_signer( _system, account( 3 ) ); error )
                              return error;

                            return treasury::transfer( _system, account( 1 ), account( 2 ), i.amount );
                          } );
  }

  std::error_code operator()( const instructions::burn& i )
  {
    return with_accounts( 3,
                          [ & ]() -> std::error_code
                          {
                            if( auto error = guard::check_signer( _system, account( 3 ) ); error )
                              return error;

                            return treasury::burn( _system, _state, account( 1 ), account( 2 ), i.amount );
                          } );
  }

  std::error_code operator()( const instructions::create_proposal& i )
  {
    return with_accounts( 1,
                          [ & ]() -> std::error_code
                          {
                            auto p =
                              governance::create_proposal( _state, account( 1 ), i.description, i.duration, _now );
                            if( !p )
                              return p.error();

                            return ledger_errc::ok;
                          } );
  }

  std::error_code operator()( const instructions::vote& i )
  {
    return with_accounts( 2,
                          [ & ]() -> std::error_code
                          {
                            if( auto error = guard::check_signer( _system, account( 1 ) ); error )
                              return error;

                            // Weight comes from the voter's own balance.
                            if( account( 2 ) != account( 1 ) )
                              return ledger_errc::validation_error;

                            return governance::vote( _state,
                                                     i.proposal_index,
                                                     i.choice,
                                                     [ & ]()
                                                     {
                                                       return treasury::balance_of( _system, account( 1 ) );
                                                     },
                                                     _now );
                          } );
  }

  std::error_code operator()( const instructions::submit_documents& )
  {
    return with_accounts( 1,
                          [ & ]() -> std::error_code
                          {
                            compliance::submit_documents( _state, account( 1 ) );
                            return ledger_errc::ok;
                          } );
  }

  std::error_code operator()( const instructions::update_compliance_status& i )
  {
    return with_accounts( 2,
                          [ & ]() -> std::error_code
                          {
                            if( auto error = guard::check_signer( _system, account( 2 ) ); error )
                              return error;

                            return compliance::update_status( _state, account( 1 ), i.kyc_approved, i.aml_approved );
                          } );
  }

  std::error_code operator()( const instructions::check_compliance_gate& )
  {
    return with_accounts( 1,
                          [ & ]() -> std::error_code
                          {
                            return compliance::check_gate( _state, account( 1 ) );
                          } );
  }

  std::error_code operator()( const instructions::update_regulatory_parameter& i )
  {
    return with_accounts( 1,
                          [ & ]() -> std::error_code
                          {
                            if( auto error = guard::check_admin( _system, _state, account( 1 ) ); error )
                              return error;

                            administration::update_regulatory_parameter( _state, i.limit );
                            return ledger_errc::ok;
                          } );
  }

  std::error_code operator()( const instructions::initialize& i )
  {
    return with_accounts( 2,
                          [ & ]() -> std::error_code
                          {
                            if( auto error = guard::check_signer( _system, account( 1 ) ); error )
                              return error;

                            return administration::initialize( _state, account( 1 ), account( 2 ), i.token_support );
                          } );
  }

  std::error_code operator()( const instructions::finalize_proposal& i )
  {
    return governance::finalize( _state, i.proposal_index, _now );
  }

  std::error_code operator()( const instructions::submit_dispute& i )
  {
    return with_accounts( 2,
                          [ & ]() -> std::error_code
                          {
                            auto d = disputes::submit( _state, account( 1 ), account( 2 ), i.claim_id, i.description );
                            if( !d )
                              return d.error();

                            return ledger_errc::ok;
                          } );
  }

  std::error_code operator()( const instructions::vote_dispute& i )
  {
    return with_accounts( 1,
                          [ & ]() -> std::error_code
                          {
                            return disputes::vote( _state, i.dispute_index, account( 1 ), i.support );
                          } );
  }

  std::error_code operator()( const instructions::pay_premium& i )
  {
    return with_accounts( 1,
                          [ & ]() -> std::error_code
                          {
                            if( auto error = guard::check_signer( _system, account( 1 ) ); error )
                              return error;

                            if( !membership::is_member( _state, account( 1 ) ) )
                              return ledger_errc::not_found;

                            return treasury::pay_premium( _system, _state, account( 1 ), i.amount );
                          } );
  }

  std::error_code operator()( const instructions::payout_claim& i )
  {
    return with_accounts( 2,
                          [ & ]() -> std::error_code
                          {
                            if( auto error = guard::check_admin( _system, _state, account( 1 ) ); error )
                              return error;

                            if( !_state.token_management )
                              return ledger_errc::invalid_state;

                            auto p = claims::pay(
                              _state,
                              i.claim_index,
                              account( 2 ),
                              [ & ]( const identity& recipient, std::uint64_t amount )
                              {
                                return treasury::disburse( _system, _state, recipient, amount );
                              },
                              _now );
                            if( !p )
                              return p.error();

                            return ledger_errc::ok;
                          } );
  }

private:
  // Accounts are counted after the record slot at index 0.
  template< typename Handler >
  std::error_code with_accounts( std::size_t required, Handler&& handler )
  {
    if( _accounts.size() <= required )
      return ledger_errc::missing_account;

    return handler();
  }

  const protocol::account& account( std::size_t index ) const
  {
    return _accounts[ index ];
  }

  program::system_interface* _system;
  aggregate& _state;
  std::span< const protocol::account > _accounts;
  timestamp _now;
};

} // namespace

protocol::account ledger_program_id() noexcept
{
  return protocol::system_program( "ledger" );
}

std::error_code processor::run( mutual::program::system_interface* system )
{
  auto accounts = system->accounts();
  if( accounts.empty() )
    return ledger_errc::missing_account;

  const auto& record = accounts.front();

  if( auto error = guard::check_ownership( system, record ); error )
    return error;

  auto data = system->get_account_data( record );
  if( !data )
    return data.error();

  auto state = codec::decode( *data );
  if( !state )
    return state.error();

  auto op = decode_instruction( system->input() );
  if( !op )
  {
    LOG_DEBUG( log::instance(),
               "Rejected instruction for record {}: {}",
               log::hex{ record.data(), record.size() },
               op.error().message() );
    return op.error();
  }

  auto name = operation_names.at( std::to_underlying( opcode_of( *op ) ) );

  if( !state->initialized() && !std::holds_alternative< instructions::initialize >( *op ) )
  {
    LOG_WARNING( log::instance(),
                 "Rejected {} on uninitialized record {}",
                 name,
                 log::hex{ record.data(), record.size() } );
    return ledger_errc::invalid_state;
  }

  if( auto error = std::visit( dispatcher( system, *state ), *op ); error )
  {
    LOG_DEBUG( log::instance(),
               "Rejected {} on record {}: {}",
               name,
               log::hex{ record.data(), record.size() },
               error.message() );
    return error;
  }

  std::vector< std::byte > scratch( data->size() );
  if( auto error = codec::encode( *state, scratch ); error )
  {
    LOG_WARNING( log::instance(),
                 "Record {} exceeds its slot of {} bytes",
                 log::hex{ record.data(), record.size() },
                 scratch.size() );
    return error;
  }

  auto slot = system->get_mutable_account_data( record );
  if( !slot )
    return slot.error();

  if( slot->size() != scratch.size() )
    return ledger_errc::capacity_error;

  std::ranges::copy( scratch, slot->begin() );

  LOG_INFO( log::instance(), "Applied {} to record {}", name, log::hex{ record.data(), record.size() } );

  return ledger_errc::ok;
}

} // namespace mutual::ledger
