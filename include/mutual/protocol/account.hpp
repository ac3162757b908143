#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/vector.hpp>

#include <mutual/crypto.hpp>

namespace mutual::protocol {

struct account: std::array< std::byte, crypto::public_key_length >
{
  explicit operator crypto::public_key() const noexcept;

  bool null() const noexcept;

  bool operator==( const account& ) const noexcept  = default;
  auto operator<=>( const account& ) const noexcept = default;
};

struct account_view: std::span< const std::byte, crypto::public_key_length >
{
  account_view( const account& ) noexcept;
  account_view( const std::byte*, std::size_t ) noexcept;

  explicit operator crypto::public_key() const noexcept;
  explicit operator account() const noexcept;
};

account user_account( const crypto::public_key& ) noexcept;
account system_program( std::string_view str ) noexcept;

// A storage slot held by the host: the owning program and a fixed-capacity data region.
struct account_slot
{
  account owner{};
  std::vector< std::byte > data;

  bool operator==( const account_slot& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & owner;
    ar & data;
  }
};

} // namespace mutual::protocol

namespace boost::serialization {

template< class Archive >
void serialize( Archive& ar, mutual::protocol::account& a, const unsigned int version )
{
  ar& static_cast< std::array< std::byte, mutual::crypto::public_key_length >& >( a );
}

} // namespace boost::serialization
