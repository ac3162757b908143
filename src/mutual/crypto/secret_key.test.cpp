// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>

#include <mutual/crypto/hash.hpp>
#include <mutual/crypto/secret_key.hpp>
#include <mutual/encode.hpp>

TEST( secret_key, sign )
{
  auto alice_hash = mutual::crypto::hash( "alice" );

  auto skey = mutual::crypto::secret_key::create( alice_hash );

  auto data = mutual::crypto::hash( "carpe diem" );

  auto signed_data = skey.sign( data );

  auto signature_data = *mutual::encode::from_hex(
    "0x9269114b9dbbe20a7ba5c6043b49145efd09eceef2305ed804788c77edd09c14"
    "359642a17ab07556515fa7443aa22583d8be36d92a43348865caec125a0e0201" );

  EXPECT_TRUE( std::ranges::equal( signature_data, signed_data ) );
}

TEST( secret_key, seed )
{
  // RFC 8032, section 7.1, test 1
  auto seed_bytes =
    *mutual::encode::from_hex( "0x9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60" );

  mutual::crypto::digest seed;
  std::ranges::copy( seed_bytes, seed.begin() );

  auto skey = mutual::crypto::secret_key::create( seed );

  auto public_bytes =
    *mutual::encode::from_hex( "0xd75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a" );

  EXPECT_TRUE( std::ranges::equal( skey.public_key().bytes(), public_bytes ) );
}

TEST( secret_key, comparison )
{
  auto alice_hash = mutual::crypto::hash( "alice" );
  auto bob_hash   = mutual::crypto::hash( "bob" );

  auto skey1 = mutual::crypto::secret_key::create( alice_hash );
  auto skey2 = mutual::crypto::secret_key::create( bob_hash );

  EXPECT_NE( skey1, skey2 );
  EXPECT_EQ( skey1, skey1 );

  auto skey1_bytes_a = skey1.bytes();
  auto skey1_bytes_b = skey1.bytes();
  auto skey2_bytes   = skey2.bytes();

  EXPECT_NE( skey1_bytes_a, skey2_bytes );
  EXPECT_EQ( skey1_bytes_a, skey1_bytes_b );
}

TEST( secret_key, determinism )
{
  auto alice_hash1 = mutual::crypto::hash( "alice" );
  auto alice_hash2 = mutual::crypto::hash( "alice" );
  auto bob_hash    = mutual::crypto::hash( "bob" );

  auto skey1 = mutual::crypto::secret_key::create( alice_hash1 );
  auto skey2 = mutual::crypto::secret_key::create( alice_hash2 );
  auto skey3 = mutual::crypto::secret_key::create( bob_hash );
  EXPECT_EQ( skey1, skey2 );
  EXPECT_NE( skey1, skey3 );

  EXPECT_EQ( skey1.public_key(), skey2.public_key() );
  EXPECT_NE( skey1.public_key(), skey3.public_key() );
}

TEST( secret_key, nondeterminism )
{
  auto skey1 = mutual::crypto::secret_key::create();

  auto data1 = mutual::crypto::hash( "carpe diem" );

  auto signed_data1 = skey1.sign( data1 );

  auto pkey1 = skey1.public_key();
  EXPECT_TRUE( pkey1.verify( signed_data1, data1 ) );

  auto skey2 = mutual::crypto::secret_key::create();

  auto data2 = mutual::crypto::hash( "carpe diem" );

  auto signed_data2 = skey2.sign( data2 );

  auto pkey2 = skey2.public_key();
  EXPECT_TRUE( pkey2.verify( signed_data2, data2 ) );

  EXPECT_NE( skey1, skey2 );
}

// NOLINTEND
