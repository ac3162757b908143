#include <mutual/host/store.hpp>

#include <fstream>
#include <stdexcept>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

namespace mutual::host {

namespace {

object_key make_key( const protocol::account& program, std::uint32_t id, std::span< const std::byte > key )
{
  return object_key{ .program = program, .id = id, .key = std::vector< std::byte >( key.begin(), key.end() ) };
}

} // namespace

std::error_code
store::create_account( const protocol::account& id, const protocol::account& owner, std::size_t capacity )
{
  auto [ itr, inserted ] =
    _accounts.try_emplace( id, protocol::account_slot{ .owner = owner, .data = std::vector< std::byte >( capacity ) } );

  if( !inserted )
    return host_errc::duplicate_account;

  return host_errc::ok;
}

const protocol::account_slot* store::find_account( protocol::account_view id ) const
{
  if( auto itr = _accounts.find( protocol::account( id ) ); itr != _accounts.end() )
    return &itr->second;

  return nullptr;
}

protocol::account_slot* store::find_account( protocol::account_view id )
{
  if( auto itr = _accounts.find( protocol::account( id ) ); itr != _accounts.end() )
    return &itr->second;

  return nullptr;
}

std::span< const std::byte >
store::get_object( const protocol::account& program, std::uint32_t id, std::span< const std::byte > key ) const
{
  if( auto itr = _objects.find( make_key( program, id, key ) ); itr != _objects.end() )
    return itr->second;

  return std::span< const std::byte >{};
}

void store::put_object( const protocol::account& program,
                        std::uint32_t id,
                        std::span< const std::byte > key,
                        std::span< const std::byte > value )
{
  _objects.insert_or_assign( make_key( program, id, key ), std::vector< std::byte >( value.begin(), value.end() ) );
}

void store::remove_object( const protocol::account& program, std::uint32_t id, std::span< const std::byte > key )
{
  _objects.erase( make_key( program, id, key ) );
}

std::size_t store::account_count() const noexcept
{
  return _accounts.size();
}

std::size_t store::object_count() const noexcept
{
  return _objects.size();
}

void store::save( const std::filesystem::path& path ) const
{
  std::ofstream file( path, std::ios::binary | std::ios::trunc );
  if( !file )
    throw std::runtime_error( "unable to open store for writing: " + path.string() );

  boost::archive::binary_oarchive oa( file );
  oa << *this;
}

void store::load( const std::filesystem::path& path )
{
  std::ifstream file( path, std::ios::binary );
  if( !file )
    throw std::runtime_error( "unable to open store for reading: " + path.string() );

  boost::archive::binary_iarchive ia( file );
  ia >> *this;
}

} // namespace mutual::host
