#include <mutual/ledger/codec.hpp>

#include <algorithm>
#include <utility>

namespace mutual::ledger::codec {

result< bool > reader::read_bool() noexcept
{
  auto value = read< std::uint8_t >();
  if( !value )
    return std::unexpected( value.error() );

  switch( *value )
  {
    case 0:
      return false;
    case 1:
      return true;
    default:
      return std::unexpected( ledger_errc::decode_error );
  }
}

result< identity > reader::read_identity() noexcept
{
  auto bytes = read_bytes( crypto::public_key_length );
  if( !bytes )
    return std::unexpected( bytes.error() );

  identity id;
  std::ranges::copy( *bytes, id.begin() );
  return id;
}

result< std::string > reader::read_string()
{
  auto length = read< std::uint32_t >();
  if( !length )
    return std::unexpected( length.error() );

  auto bytes = read_bytes( *length );
  if( !bytes )
    return std::unexpected( bytes.error() );

  return std::string( memory::as_string_view( *bytes ) );
}

result< std::span< const std::byte > > reader::read_bytes( std::size_t length ) noexcept
{
  if( remaining() < length )
    return std::unexpected( ledger_errc::decode_error );

  auto bytes  = _data.subspan( _offset, length );
  _offset    += length;
  return bytes;
}

std::span< const std::byte > reader::rest() noexcept
{
  auto bytes = _data.subspan( _offset );
  _offset    = _data.size();
  return bytes;
}

namespace {

template< typename T >
result< T > read_enum( reader& r, T last ) noexcept
{
  auto value = r.read< std::uint8_t >();
  if( !value )
    return std::unexpected( value.error() );

  if( *value > std::to_underlying( last ) )
    return std::unexpected( ledger_errc::decode_error );

  return static_cast< T >( *value );
}

void encode_member( writer& w, const member& m )
{
  w.write( m.address );
  w.write( m.joined_at );
}

void encode_claim( writer& w, const claim& c )
{
  w.write( c.id );
  w.write( c.member );
  w.write( c.amount );
  w.write( c.verified );
}

void encode_proposal( writer& w, const proposal& p )
{
  w.write( p.id );
  w.write( p.proposer );
  w.write( p.description );
  w.write( p.vote_start );
  w.write( p.vote_end );
  w.write( p.yes_votes );
  w.write( p.no_votes );
  w.write( std::to_underlying( p.status ) );
}

void encode_compliance( writer& w, const member_compliance& c )
{
  w.write( c.member );
  w.write( std::to_underlying( c.kyc_status ) );
  w.write( std::to_underlying( c.aml_status ) );
}

void encode_dispute( writer& w, const dispute& d )
{
  w.write( d.id );
  w.write( d.claim_id.has_value() );
  if( d.claim_id )
    w.write( *d.claim_id );
  w.write( d.initiator );
  w.write( d.respondent );
  w.write( d.description );
  w.write( std::to_underlying( d.status ) );
  w.write( static_cast< std::uint32_t >( d.votes.size() ) );
  for( const auto& vote: d.votes )
  {
    w.write( vote.voter );
    w.write( vote.support );
  }
}

void encode_payout( writer& w, const payout& p )
{
  w.write( p.claim_id );
  w.write( p.recipient );
  w.write( p.amount );
  w.write( p.paid_at );
}

template< typename T, typename Encoder >
void encode_sequence( writer& w, const std::vector< T >& values, Encoder&& encoder )
{
  w.write( static_cast< std::uint32_t >( values.size() ) );
  for( const auto& value: values )
    encoder( w, value );
}

result< member > decode_member( reader& r )
{
  member m;

  auto address = r.read_identity();
  if( !address )
    return std::unexpected( address.error() );
  m.address = *address;

  auto joined_at = r.read< timestamp >();
  if( !joined_at )
    return std::unexpected( joined_at.error() );
  m.joined_at = *joined_at;

  return m;
}

result< claim > decode_claim( reader& r )
{
  claim c;

  auto id = r.read< std::uint64_t >();
  if( !id )
    return std::unexpected( id.error() );
  c.id = *id;

  auto owner = r.read_identity();
  if( !owner )
    return std::unexpected( owner.error() );
  c.member = *owner;

  auto amount = r.read< std::uint64_t >();
  if( !amount )
    return std::unexpected( amount.error() );
  c.amount = *amount;

  auto verified = r.read_bool();
  if( !verified )
    return std::unexpected( verified.error() );
  c.verified = *verified;

  return c;
}

result< proposal > decode_proposal( reader& r )
{
  proposal p;

  auto id = r.read< std::uint64_t >();
  if( !id )
    return std::unexpected( id.error() );
  p.id = *id;

  auto proposer = r.read_identity();
  if( !proposer )
    return std::unexpected( proposer.error() );
  p.proposer = *proposer;

  auto description = r.read_string();
  if( !description )
    return std::unexpected( description.error() );
  p.description = std::move( *description );

  auto vote_start = r.read< timestamp >();
  if( !vote_start )
    return std::unexpected( vote_start.error() );
  p.vote_start = *vote_start;

  auto vote_end = r.read< timestamp >();
  if( !vote_end )
    return std::unexpected( vote_end.error() );
  p.vote_end = *vote_end;

  auto yes_votes = r.read< std::uint64_t >();
  if( !yes_votes )
    return std::unexpected( yes_votes.error() );
  p.yes_votes = *yes_votes;

  auto no_votes = r.read< std::uint64_t >();
  if( !no_votes )
    return std::unexpected( no_votes.error() );
  p.no_votes = *no_votes;

  auto status = read_enum( r, proposal_status::rejected );
  if( !status )
    return std::unexpected( status.error() );
  p.status = *status;

  return p;
}

result< member_compliance > decode_compliance( reader& r )
{
  member_compliance c;

  auto owner = r.read_identity();
  if( !owner )
    return std::unexpected( owner.error() );
  c.member = *owner;

  auto kyc = read_enum( r, compliance_status::rejected );
  if( !kyc )
    return std::unexpected( kyc.error() );
  c.kyc_status = *kyc;

  auto aml = read_enum( r, compliance_status::rejected );
  if( !aml )
    return std::unexpected( aml.error() );
  c.aml_status = *aml;

  return c;
}

result< dispute > decode_dispute( reader& r )
{
  dispute d;

  auto id = r.read< std::uint64_t >();
  if( !id )
    return std::unexpected( id.error() );
  d.id = *id;

  auto has_claim = r.read_bool();
  if( !has_claim )
    return std::unexpected( has_claim.error() );

  if( *has_claim )
  {
    auto claim_id = r.read< std::uint64_t >();
    if( !claim_id )
      return std::unexpected( claim_id.error() );
    d.claim_id = *claim_id;
  }

  auto initiator = r.read_identity();
  if( !initiator )
    return std::unexpected( initiator.error() );
  d.initiator = *initiator;

  auto respondent = r.read_identity();
  if( !respondent )
    return std::unexpected( respondent.error() );
  d.respondent = *respondent;

  auto description = r.read_string();
  if( !description )
    return std::unexpected( description.error() );
  d.description = std::move( *description );

  auto status = read_enum( r, dispute_status::dismissed );
  if( !status )
    return std::unexpected( status.error() );
  d.status = *status;

  auto count = r.read< std::uint32_t >();
  if( !count )
    return std::unexpected( count.error() );

  for( std::uint32_t i = 0; i < *count; ++i )
  {
    dispute_vote vote;

    auto voter = r.read_identity();
    if( !voter )
      return std::unexpected( voter.error() );
    vote.voter = *voter;

    auto support = r.read_bool();
    if( !support )
      return std::unexpected( support.error() );
    vote.support = *support;

    d.votes.push_back( vote );
  }

  return d;
}

result< payout > decode_payout( reader& r )
{
  payout p;

  auto claim_id = r.read< std::uint64_t >();
  if( !claim_id )
    return std::unexpected( claim_id.error() );
  p.claim_id = *claim_id;

  auto recipient = r.read_identity();
  if( !recipient )
    return std::unexpected( recipient.error() );
  p.recipient = *recipient;

  auto amount = r.read< std::uint64_t >();
  if( !amount )
    return std::unexpected( amount.error() );
  p.amount = *amount;

  auto paid_at = r.read< timestamp >();
  if( !paid_at )
    return std::unexpected( paid_at.error() );
  p.paid_at = *paid_at;

  return p;
}

template< typename T, typename Decoder >
std::error_code decode_sequence( reader& r, std::vector< T >& values, Decoder&& decoder )
{
  auto count = r.read< std::uint32_t >();
  if( !count )
    return count.error();

  for( std::uint32_t i = 0; i < *count; ++i )
  {
    auto value = decoder( r );
    if( !value )
      return value.error();

    values.push_back( std::move( *value ) );
  }

  return {};
}

} // namespace

std::vector< std::byte > encode( const aggregate& state )
{
  std::vector< std::byte > buffer;
  writer w( buffer );

  w.write( state.admin );
  w.write( state.treasury );
  encode_sequence( w, state.members, encode_member );
  encode_sequence( w, state.claims, encode_claim );
  encode_sequence( w, state.proposals, encode_proposal );
  encode_sequence( w, state.member_compliance, encode_compliance );

  w.write( state.token_management.has_value() );
  if( state.token_management )
    w.write( state.token_management->total_supply );

  w.write( state.regulatory_limit );
  encode_sequence( w, state.disputes, encode_dispute );
  encode_sequence( w, state.payouts, encode_payout );

  return buffer;
}

std::error_code encode( const aggregate& state, std::span< std::byte > slot )
{
  auto buffer = encode( state );

  if( buffer.size() > slot.size() )
    return ledger_errc::capacity_error;

  auto end = std::ranges::copy( buffer, slot.begin() ).out;
  std::fill( end, slot.end(), std::byte{ 0x00 } );

  return {};
}

result< aggregate > decode( std::span< const std::byte > data )
{
  aggregate state;
  reader r( data );

  auto admin = r.read_identity();
  if( !admin )
    return std::unexpected( admin.error() );
  state.admin = *admin;

  auto treasury = r.read_identity();
  if( !treasury )
    return std::unexpected( treasury.error() );
  state.treasury = *treasury;

  if( auto error = decode_sequence( r, state.members, decode_member ); error )
    return std::unexpected( error );

  if( auto error = decode_sequence( r, state.claims, decode_claim ); error )
    return std::unexpected( error );

  if( auto error = decode_sequence( r, state.proposals, decode_proposal ); error )
    return std::unexpected( error );

  if( auto error = decode_sequence( r, state.member_compliance, decode_compliance ); error )
    return std::unexpected( error );

  auto has_token_management = r.read_bool();
  if( !has_token_management )
    return std::unexpected( has_token_management.error() );

  if( *has_token_management )
  {
    auto total_supply = r.read< std::uint64_t >();
    if( !total_supply )
      return std::unexpected( total_supply.error() );
    state.token_management = token_management{ .total_supply = *total_supply };
  }

  auto regulatory_limit = r.read< std::uint64_t >();
  if( !regulatory_limit )
    return std::unexpected( regulatory_limit.error() );
  state.regulatory_limit = *regulatory_limit;

  if( auto error = decode_sequence( r, state.disputes, decode_dispute ); error )
    return std::unexpected( error );

  if( auto error = decode_sequence( r, state.payouts, decode_payout ); error )
    return std::unexpected( error );

  return state;
}

} // namespace mutual::ledger::codec
