// NOLINTBEGIN

#include <gtest/gtest.h>

#include <string_view>

#include <mutual/encode/utf8.hpp>

using namespace std::string_view_literals;

TEST( utf8, valid )
{
  EXPECT_TRUE( mutual::encode::valid_utf8( ""sv ) );
  EXPECT_TRUE( mutual::encode::valid_utf8( "Raise the cap"sv ) );
  EXPECT_TRUE( mutual::encode::valid_utf8( "caf\xc3\xa9"sv ) );
  EXPECT_TRUE( mutual::encode::valid_utf8( "\xe2\x82\xac 10"sv ) );
  EXPECT_TRUE( mutual::encode::valid_utf8( "\xf0\x9f\x98\x80"sv ) );
}

TEST( utf8, invalid )
{
  EXPECT_FALSE( mutual::encode::valid_utf8( "\xff"sv ) );
  EXPECT_FALSE( mutual::encode::valid_utf8( "caf\xc3"sv ) );
  EXPECT_FALSE( mutual::encode::valid_utf8( "\xc0\xaf"sv ) );
  EXPECT_FALSE( mutual::encode::valid_utf8( "\xed\xa0\x80"sv ) );
  EXPECT_FALSE( mutual::encode::valid_utf8( "ok\x80"sv ) );
}

// NOLINTEND
