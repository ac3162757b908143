#pragma once

#include <cstdint>
#include <string>

#include <mutual/program/error.hpp>
#include <mutual/program/program.hpp>
#include <mutual/protocol/account.hpp>

namespace mutual::program {

// Fungible token sub-ledger. Balances and supply live in the program's object space. Supply only
// changes when the minting program calls mint or burn.
struct token final: public program
{
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    name,
    symbol,
    decimals,
    total_supply,
    balance_of,
    transfer,
    mint,
    burn
  };

  explicit token( protocol::account minter ) noexcept;
  token( const token& ) = delete;
  token( token&& )      = delete;
  ~token() override     = default;

  token& operator=( const token& ) = delete;
  token& operator=( token&& )      = delete;

  std::error_code run( system_interface* system ) override;

private:
  result< std::uint64_t > total_supply( system_interface* system );
  result< std::uint64_t > balance_of( system_interface* system, std::span< const std::byte > account );

  protocol::account _minter;
};

protocol::account token_program_id() noexcept;

} // namespace mutual::program
