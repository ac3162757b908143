#pragma once

#include <cstdint>
#include <vector>

#include <mutual/crypto.hpp>
#include <mutual/protocol/account.hpp>

namespace mutual::protocol {

// One call into a program: the program identity, the accounts it may reference in order and the opaque input.
struct instruction
{
  account program{};
  std::vector< account > accounts;
  std::vector< std::byte > data;
};

struct authorization
{
  account signer{};
  crypto::signature signature{};
};

struct transaction
{
  crypto::digest id{};
  std::uint64_t nonce = 0;
  protocol::instruction instruction;
  std::vector< authorization > authorizations;

  bool validate() const noexcept;
};

crypto::digest make_id( const transaction& t ) noexcept;

} // namespace mutual::protocol
