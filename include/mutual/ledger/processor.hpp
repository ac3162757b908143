#pragma once

#include <system_error>

#include <mutual/program/program.hpp>
#include <mutual/protocol/account.hpp>

namespace mutual::ledger {

// Entry point of the ledger. Account [0] of every instruction is the record slot the program owns; the
// record is decoded, mutated by exactly one instruction and written back only when that instruction succeeds.
struct processor final: public program::program
{
  processor()                   = default;
  processor( const processor& ) = delete;
  processor( processor&& )      = delete;
  ~processor() override         = default;

  processor& operator=( const processor& ) = delete;
  processor& operator=( processor&& )      = delete;

  std::error_code run( mutual::program::system_interface* system ) override;
};

protocol::account ledger_program_id() noexcept;

} // namespace mutual::ledger
