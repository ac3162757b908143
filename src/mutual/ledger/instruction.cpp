#include <mutual/ledger/instruction.hpp>

#include <concepts>
#include <string>
#include <utility>

#include <mutual/encode/utf8.hpp>
#include <mutual/ledger/codec.hpp>

namespace mutual::ledger {

namespace {

// Payload flags are strict booleans; anything but 0 or 1 is rejected.
result< bool > read_flag( codec::reader& r ) noexcept
{
  auto value = r.read< std::uint8_t >();
  if( !value )
    return std::unexpected( ledger_errc::validation_error );

  switch( *value )
  {
    case 0:
      return false;
    case 1:
      return true;
    default:
      return std::unexpected( ledger_errc::validation_error );
  }
}

template< std::integral T >
result< T > read_value( codec::reader& r ) noexcept
{
  auto value = r.read< T >();
  if( !value )
    return std::unexpected( ledger_errc::validation_error );

  return *value;
}

// Descriptions take the remainder of the payload.
result< std::string > read_text( codec::reader& r )
{
  auto text = memory::as_string_view( r.rest() );
  if( !encode::valid_utf8( text ) )
    return std::unexpected( ledger_errc::validation_error );

  return std::string( text );
}

result< instruction > decode_payload( opcode op, codec::reader& r )
{
  switch( op )
  {
    case opcode::join:
      return instructions::join{};
    case opcode::submit_claim:
      return instructions::submit_claim{};
    case opcode::verify_claim:
      return read_value< std::uint64_t >( r ).transform(
        []( std::uint64_t index ) -> instruction
        {
          return instructions::verify_claim{ .claim_index = index };
        } );
    case opcode::mint:
      return read_value< std::uint64_t >( r ).transform(
        []( std::uint64_t amount ) -> instruction
        {
          return instructions::mint{ .amount = amount };
        } );
    case opcode::transfer:
      return read_value< std::uint64_t >( r ).transform(
        []( std::uint64_t amount ) -> instruction
        {
          return instructions::transfer{ .amount = amount };
        } );
    case opcode::burn:
      return read_value< std::uint64_t >( r ).transform(
        []( std::uint64_t amount ) -> instruction
        {
          return instructions::burn{ .amount = amount };
        } );
    case opcode::create_proposal:
      {
        auto duration = read_value< std::int64_t >( r );
        if( !duration )
          return std::unexpected( duration.error() );

        if( *duration < 0 )
          return std::unexpected( ledger_errc::validation_error );

        auto description = read_text( r );
        if( !description )
          return std::unexpected( description.error() );

        return instructions::create_proposal{ .duration = *duration, .description = std::move( *description ) };
      }
    case opcode::vote:
      {
        auto index = read_value< std::uint64_t >( r );
        if( !index )
          return std::unexpected( index.error() );

        auto choice = read_flag( r );
        if( !choice )
          return std::unexpected( choice.error() );

        return instructions::vote{ .proposal_index = *index,
                                   .choice         = *choice ? vote_choice::yes : vote_choice::no };
      }
    case opcode::submit_documents:
      return instructions::submit_documents{};
    case opcode::update_compliance_status:
      {
        auto kyc = read_flag( r );
        if( !kyc )
          return std::unexpected( kyc.error() );

        auto aml = read_flag( r );
        if( !aml )
          return std::unexpected( aml.error() );

        return instructions::update_compliance_status{ .kyc_approved = *kyc, .aml_approved = *aml };
      }
    case opcode::check_compliance_gate:
      return instructions::check_compliance_gate{};
    case opcode::update_regulatory_parameter:
      return read_value< std::uint64_t >( r ).transform(
        []( std::uint64_t limit ) -> instruction
        {
          return instructions::update_regulatory_parameter{ .limit = limit };
        } );
    case opcode::initialize:
      return read_flag( r ).transform(
        []( bool token_support ) -> instruction
        {
          return instructions::initialize{ .token_support = token_support };
        } );
    case opcode::finalize_proposal:
      return read_value< std::uint64_t >( r ).transform(
        []( std::uint64_t index ) -> instruction
        {
          return instructions::finalize_proposal{ .proposal_index = index };
        } );
    case opcode::submit_dispute:
      {
        auto has_claim = read_flag( r );
        if( !has_claim )
          return std::unexpected( has_claim.error() );

        auto claim_id = read_value< std::uint64_t >( r );
        if( !claim_id )
          return std::unexpected( claim_id.error() );

        auto description = read_text( r );
        if( !description )
          return std::unexpected( description.error() );

        instructions::submit_dispute i{ .description = std::move( *description ) };
        if( *has_claim )
          i.claim_id = *claim_id;

        return i;
      }
    case opcode::vote_dispute:
      {
        auto index = read_value< std::uint64_t >( r );
        if( !index )
          return std::unexpected( index.error() );

        auto support = read_flag( r );
        if( !support )
          return std::unexpected( support.error() );

        return instructions::vote_dispute{ .dispute_index = *index, .support = *support };
      }
    case opcode::pay_premium:
      return read_value< std::uint64_t >( r ).transform(
        []( std::uint64_t amount ) -> instruction
        {
          return instructions::pay_premium{ .amount = amount };
        } );
    case opcode::payout_claim:
      return read_value< std::uint64_t >( r ).transform(
        []( std::uint64_t index ) -> instruction
        {
          return instructions::payout_claim{ .claim_index = index };
        } );
  }

  return std::unexpected( ledger_errc::unknown_operation );
}

} // namespace

opcode opcode_of( const instruction& i ) noexcept
{
  return static_cast< opcode >( i.index() );
}

result< instruction > decode_instruction( std::span< const std::byte > data )
{
  if( data.empty() )
    return std::unexpected( ledger_errc::validation_error );

  codec::reader r( data );

  auto op = r.read< std::uint8_t >();
  if( !op )
    return std::unexpected( ledger_errc::validation_error );

  if( *op > std::to_underlying( opcode::payout_claim ) )
    return std::unexpected( ledger_errc::unknown_operation );

  auto decoded = decode_payload( static_cast< opcode >( *op ), r );
  if( !decoded )
    return decoded;

  if( r.remaining() )
    return std::unexpected( ledger_errc::validation_error );

  return decoded;
}

std::vector< std::byte > encode_instruction( const instruction& i )
{
  std::vector< std::byte > buffer;
  codec::writer w( buffer );

  w.write( std::to_underlying( opcode_of( i ) ) );

  auto write_text = [ & ]( const std::string& text )
  {
    w.append( memory::as_bytes( text ) );
  };

  std::visit(
    [ & ]< typename T >( const T& payload )
    {
      if constexpr( std::same_as< T, instructions::verify_claim > )
        w.write( payload.claim_index );
      else if constexpr( std::same_as< T, instructions::mint > || std::same_as< T, instructions::transfer >
                         || std::same_as< T, instructions::burn > || std::same_as< T, instructions::pay_premium > )
        w.write( payload.amount );
      else if constexpr( std::same_as< T, instructions::create_proposal > )
      {
        w.write( payload.duration );
        write_text( payload.description );
      }
      else if constexpr( std::same_as< T, instructions::vote > )
      {
        w.write( payload.proposal_index );
        w.write( payload.choice == vote_choice::yes );
      }
      else if constexpr( std::same_as< T, instructions::update_compliance_status > )
      {
        w.write( payload.kyc_approved );
        w.write( payload.aml_approved );
      }
      else if constexpr( std::same_as< T, instructions::update_regulatory_parameter > )
        w.write( payload.limit );
      else if constexpr( std::same_as< T, instructions::initialize > )
        w.write( payload.token_support );
      else if constexpr( std::same_as< T, instructions::finalize_proposal > )
        w.write( payload.proposal_index );
      else if constexpr( std::same_as< T, instructions::payout_claim > )
        w.write( payload.claim_index );
      else if constexpr( std::same_as< T, instructions::submit_dispute > )
      {
        w.write( payload.claim_id.has_value() );
        w.write( payload.claim_id.value_or( 0 ) );
        write_text( payload.description );
      }
      else if constexpr( std::same_as< T, instructions::vote_dispute > )
      {
        w.write( payload.dispute_index );
        w.write( payload.support );
      }
    },
    i );

  return buffer;
}

} // namespace mutual::ledger
