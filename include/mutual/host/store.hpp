#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <span>
#include <system_error>
#include <vector>

#include <boost/serialization/map.hpp>
#include <boost/serialization/vector.hpp>

#include <mutual/host/error.hpp>
#include <mutual/protocol/account.hpp>

namespace mutual::host {

// Objects are private to the program that wrote them.
struct object_key
{
  protocol::account program{};
  std::uint32_t id = 0;
  std::vector< std::byte > key;

  auto operator<=>( const object_key& ) const = default;
  bool operator==( const object_key& ) const  = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & program;
    ar & id;
    ar & key;
  }
};

// Account slots and program objects. Copyable so a caller can snapshot and restore it around an invocation.
class store
{
public:
  std::error_code create_account( const protocol::account& id, const protocol::account& owner, std::size_t capacity );

  const protocol::account_slot* find_account( protocol::account_view id ) const;
  protocol::account_slot* find_account( protocol::account_view id );

  std::span< const std::byte >
  get_object( const protocol::account& program, std::uint32_t id, std::span< const std::byte > key ) const;

  void put_object( const protocol::account& program,
                   std::uint32_t id,
                   std::span< const std::byte > key,
                   std::span< const std::byte > value );

  void remove_object( const protocol::account& program, std::uint32_t id, std::span< const std::byte > key );

  std::size_t account_count() const noexcept;
  std::size_t object_count() const noexcept;

  void save( const std::filesystem::path& path ) const;
  void load( const std::filesystem::path& path );

  bool operator==( const store& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & _accounts;
    ar & _objects;
  }

private:
  std::map< protocol::account, protocol::account_slot > _accounts;
  std::map< object_key, std::vector< std::byte > > _objects;
};

} // namespace mutual::host
