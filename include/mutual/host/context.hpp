#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <vector>

#include <mutual/host/call_stack.hpp>
#include <mutual/host/error.hpp>
#include <mutual/host/store.hpp>
#include <mutual/program.hpp>
#include <mutual/protocol.hpp>

namespace mutual::host {

using program_registry_map = std::map< protocol::account, std::unique_ptr< program::program > >;

// Runs one transaction at a time against a store. Signatures are verified before the program runs and
// the store is restored to its prior contents when the program fails.
class context final: public program::system_interface
{
public:
  context()                  = delete;
  context( const context& )  = delete;
  context( context&& )       = delete;
  explicit context( store& s, std::size_t stack_limit = call_stack::default_stack_limit );

  ~context() final = default;

  context& operator=( const context& ) = delete;
  context& operator=( context&& )      = delete;

  void set_time( std::int64_t time ) noexcept;

  result< protocol::program_output > execute( const protocol::transaction& transaction );

  std::span< const std::byte > input() final;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;

  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) final;

  result< bool > check_authority( protocol::account_view account ) final;

  std::span< const std::byte > get_caller() final;
  protocol::account_view get_program_id() final;
  std::span< const protocol::account > accounts() final;

  result< protocol::account_view > get_account_owner( protocol::account_view account ) final;
  result< std::span< const std::byte > > get_account_data( protocol::account_view account ) final;
  result< std::span< std::byte > > get_mutable_account_data( protocol::account_view account ) final;

  std::int64_t get_time() final;

  result< protocol::program_output > call_program( protocol::account_view account,
                                                   std::span< const std::byte > stdin ) final;

private:
  result< protocol::program_output > run_program( protocol::account_view account,
                                                  std::span< const protocol::account > accounts,
                                                  std::span< const std::byte > stdin );

  store& _store;
  call_stack _stack;
  std::int64_t _time = 0;

  const protocol::transaction* _transaction = nullptr;
  std::vector< protocol::account > _verified_signatures;

  static const program_registry_map program_registry;
};

} // namespace mutual::host
