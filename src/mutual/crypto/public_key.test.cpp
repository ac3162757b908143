// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>

#include <mutual/crypto/hash.hpp>
#include <mutual/crypto/public_key.hpp>
#include <mutual/crypto/secret_key.hpp>
#include <mutual/encode.hpp>

TEST( public_key, verify )
{
  auto alice_hash = mutual::crypto::hash( "alice" );

  auto skey = mutual::crypto::secret_key::create( alice_hash );

  auto pkey = skey.public_key();

  auto data = mutual::crypto::hash( "carpe diem" );

  auto signature_data = *mutual::encode::from_hex(
    "0x9269114b9dbbe20a7ba5c6043b49145efd09eceef2305ed804788c77edd09c14"
    "359642a17ab07556515fa7443aa22583d8be36d92a43348865caec125a0e0201" );

  mutual::crypto::signature signature;
  std::ranges::copy( signature_data, signature.begin() );

  EXPECT_TRUE( pkey.verify( signature, data ) );

  EXPECT_FALSE( pkey.verify( signature, mutual::crypto::hash( "carpe noctem" ) ) );

  signature[ 0 ] ^= std::byte{ 0x01 };
  EXPECT_FALSE( pkey.verify( signature, data ) );

  auto bob = mutual::crypto::secret_key::create( mutual::crypto::hash( "bob" ) );
  EXPECT_FALSE( bob.public_key().verify( skey.sign( data ), data ) );
}

TEST( public_key, comparison )
{
  auto skey1 = mutual::crypto::secret_key::create( mutual::crypto::hash( "alice" ) );
  auto skey2 = mutual::crypto::secret_key::create( mutual::crypto::hash( "bob" ) );

  auto pkey1 = skey1.public_key();
  auto pkey2 = skey2.public_key();

  EXPECT_NE( pkey1, pkey2 );
  EXPECT_EQ( pkey1, pkey1 );

  auto pkey1_bytes_a = pkey1.bytes();
  auto pkey1_bytes_b = pkey1.bytes();
  auto pkey2_bytes   = pkey2.bytes();

  EXPECT_FALSE( std::ranges::equal( pkey1_bytes_a, pkey2_bytes ) );
  EXPECT_TRUE( std::ranges::equal( pkey1_bytes_a, pkey1_bytes_b ) );
}

// NOLINTEND
