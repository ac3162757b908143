#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <boost/endian.hpp>

#include <mutual/ledger/error.hpp>
#include <mutual/ledger/types.hpp>
#include <mutual/memory.hpp>

namespace mutual::ledger::codec {

class writer
{
public:
  explicit writer( std::vector< std::byte >& buffer ) noexcept:
      _buffer( buffer )
  {}

  template< std::integral T >
  void write( T t )
  {
    boost::endian::native_to_little_inplace( t );
    append( memory::as_bytes( t ) );
  }

  void write( bool b )
  {
    _buffer.push_back( b ? std::byte{ 0x01 } : std::byte{ 0x00 } );
  }

  void write( const identity& id )
  {
    append( id );
  }

  void write( const std::string& s )
  {
    write( static_cast< std::uint32_t >( s.size() ) );
    append( memory::as_bytes( s ) );
  }

  void append( std::span< const std::byte > bytes )
  {
    _buffer.insert( _buffer.end(), bytes.begin(), bytes.end() );
  }

private:
  std::vector< std::byte >& _buffer;
};

class reader
{
public:
  explicit reader( std::span< const std::byte > data ) noexcept:
      _data( data )
  {}

  template< std::integral T >
    requires( !std::same_as< T, bool > )
  result< T > read() noexcept
  {
    if( remaining() < sizeof( T ) )
      return std::unexpected( ledger_errc::decode_error );

    auto t   = memory::bit_cast< T >( _data.subspan( _offset, sizeof( T ) ) );
    _offset += sizeof( T );
    return boost::endian::little_to_native( t );
  }

  result< bool > read_bool() noexcept;
  result< identity > read_identity() noexcept;
  result< std::string > read_string();
  result< std::span< const std::byte > > read_bytes( std::size_t length ) noexcept;

  std::span< const std::byte > rest() noexcept;

  std::size_t remaining() const noexcept
  {
    return _data.size() - _offset;
  }

private:
  std::span< const std::byte > _data;
  std::size_t _offset = 0;
};

std::vector< std::byte > encode( const aggregate& state );

// Writes the record at the start of the slot and zero-fills the remainder.
std::error_code encode( const aggregate& state, std::span< std::byte > slot );

result< aggregate > decode( std::span< const std::byte > data );

} // namespace mutual::ledger::codec
