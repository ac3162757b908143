#pragma once

#include <cstdint>
#include <span>

#include <mutual/program/error.hpp>
#include <mutual/protocol.hpp>

namespace mutual::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

// Everything a program may observe or change outside of its own memory. A host supplies one
// implementation per invocation.
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  // Complete instruction input of the current frame, independent of what read() has consumed.
  virtual std::span< const std::byte > input() = 0;

  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer )        = 0;

  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  // Signer evidence: whether the account produced a valid signature over this invocation.
  virtual result< bool > check_authority( protocol::account_view account ) = 0;

  virtual std::span< const std::byte > get_caller()     = 0;
  virtual protocol::account_view get_program_id()       = 0;
  virtual std::span< const protocol::account > accounts() = 0;

  virtual result< protocol::account_view > get_account_owner( protocol::account_view account )             = 0;
  virtual result< std::span< const std::byte > > get_account_data( protocol::account_view account )        = 0;
  virtual result< std::span< std::byte > > get_mutable_account_data( protocol::account_view account )      = 0;

  // Timestamp oracle, unix seconds.
  virtual std::int64_t get_time() = 0;

  virtual result< protocol::program_output > call_program( protocol::account_view account,
                                                           std::span< const std::byte > stdin ) = 0;
};

} // namespace mutual::program
