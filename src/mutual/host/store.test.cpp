// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <vector>

#include <mutual/host/store.hpp>
#include <mutual/memory.hpp>
#include <mutual/protocol/account.hpp>

using namespace mutual;

TEST( store, accounts )
{
  host::store s;
  auto id    = protocol::system_program( "record" );
  auto owner = protocol::system_program( "ledger" );

  EXPECT_EQ( s.find_account( id ), nullptr );
  EXPECT_FALSE( s.create_account( id, owner, 64 ) );
  EXPECT_EQ( s.create_account( id, owner, 128 ), host::host_errc::duplicate_account );
  EXPECT_EQ( s.account_count(), 1 );

  auto slot = s.find_account( id );
  ASSERT_NE( slot, nullptr );
  EXPECT_EQ( slot->owner, owner );
  ASSERT_EQ( slot->data.size(), 64 );
  EXPECT_TRUE( std::ranges::all_of( slot->data, []( std::byte b ) { return b == std::byte{ 0x00 }; } ) );

  slot->data[ 0 ] = std::byte{ 0x2a };

  const auto& cs = s;
  EXPECT_EQ( cs.find_account( id )->data[ 0 ], std::byte{ 0x2a } );
}

TEST( store, objects )
{
  host::store s;
  auto token  = protocol::system_program( "token" );
  auto ledger = protocol::system_program( "ledger" );

  std::vector< std::byte > key{ std::byte{ 0x01 } };
  std::vector< std::byte > value{ std::byte{ 0x0a }, std::byte{ 0x0b } };

  EXPECT_TRUE( s.get_object( token, 1, key ).empty() );

  s.put_object( token, 1, key, value );
  EXPECT_TRUE( std::ranges::equal( s.get_object( token, 1, key ), value ) );

  // Objects are scoped by program and id.
  EXPECT_TRUE( s.get_object( ledger, 1, key ).empty() );
  EXPECT_TRUE( s.get_object( token, 0, key ).empty() );

  s.put_object( token, 0, {}, value );
  EXPECT_EQ( s.object_count(), 2 );
  EXPECT_TRUE( std::ranges::equal( s.get_object( token, 0, {} ), value ) );

  value.push_back( std::byte{ 0x0c } );
  s.put_object( token, 1, key, value );
  EXPECT_EQ( s.get_object( token, 1, key ).size(), 3 );

  s.remove_object( token, 1, key );
  EXPECT_TRUE( s.get_object( token, 1, key ).empty() );
  EXPECT_EQ( s.object_count(), 1 );
}

TEST( store, snapshot )
{
  host::store s;
  auto id = protocol::system_program( "record" );
  ASSERT_FALSE( s.create_account( id, protocol::system_program( "ledger" ), 8 ) );

  auto snapshot = s;
  EXPECT_EQ( snapshot, s );

  s.find_account( id )->data[ 3 ] = std::byte{ 0xff };
  s.put_object( id, 0, {}, std::vector< std::byte >{ std::byte{ 0x01 } } );
  EXPECT_NE( snapshot, s );

  s = snapshot;
  EXPECT_EQ( s.find_account( id )->data[ 3 ], std::byte{ 0x00 } );
  EXPECT_EQ( s.object_count(), 0 );
}

TEST( store, persistence )
{
  auto path = std::filesystem::temp_directory_path() / "mutual_store_test.store";
  std::filesystem::remove( path );

  host::store s;
  auto id = protocol::system_program( "record" );
  ASSERT_FALSE( s.create_account( id, protocol::system_program( "ledger" ), 16 ) );
  s.find_account( id )->data[ 0 ] = std::byte{ 0x07 };
  s.put_object( protocol::system_program( "token" ),
                1,
                std::vector< std::byte >{ std::byte{ 0x01 }, std::byte{ 0x02 } },
                std::vector< std::byte >{ std::byte{ 0x03 } } );

  s.save( path );

  host::store loaded;
  loaded.load( path );
  EXPECT_EQ( loaded, s );
  EXPECT_EQ( loaded.account_count(), 1 );
  EXPECT_EQ( loaded.object_count(), 1 );

  std::filesystem::remove( path );

  host::store missing;
  EXPECT_THROW( missing.load( path ), std::runtime_error );
}

// NOLINTEND
