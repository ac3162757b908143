#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <mutual/protocol/account.hpp>

namespace mutual::ledger {

using identity  = protocol::account;
using timestamp = std::int64_t;

// Recorded for every submitted claim; the amount is not taken from the instruction.
constexpr std::uint64_t claim_placeholder_amount = 1'000'000;

// A dispute closes once it holds more votes than this.
constexpr std::size_t dispute_vote_threshold = 5;

struct member
{
  identity address{};
  timestamp joined_at = 0;

  bool operator==( const member& ) const = default;
};

struct claim
{
  std::uint64_t id = 0;
  identity member{};
  std::uint64_t amount = 0;
  bool verified        = false;

  bool operator==( const claim& ) const = default;
};

enum class proposal_status : std::uint8_t
{
  pending,
  active,
  passed,
  rejected
};

enum class vote_choice : std::uint8_t
{
  no,
  yes
};

struct proposal
{
  std::uint64_t id = 0;
  identity proposer{};
  std::string description;
  timestamp vote_start    = 0;
  timestamp vote_end      = 0;
  std::uint64_t yes_votes = 0;
  std::uint64_t no_votes  = 0;
  proposal_status status  = proposal_status::pending;

  bool operator==( const proposal& ) const = default;
};

enum class compliance_status : std::uint8_t
{
  pending,
  approved,
  rejected
};

struct member_compliance
{
  identity member{};
  compliance_status kyc_status = compliance_status::pending;
  compliance_status aml_status = compliance_status::pending;

  bool operator==( const member_compliance& ) const = default;
};

struct token_management
{
  std::uint64_t total_supply = 0;

  bool operator==( const token_management& ) const = default;
};

enum class dispute_status : std::uint8_t
{
  open,
  upheld,
  dismissed
};

struct dispute_vote
{
  identity voter{};
  bool support = false;

  bool operator==( const dispute_vote& ) const = default;
};

struct dispute
{
  std::uint64_t id = 0;
  std::optional< std::uint64_t > claim_id;
  identity initiator{};
  identity respondent{};
  std::string description;
  dispute_status status = dispute_status::open;
  std::vector< dispute_vote > votes;

  bool operator==( const dispute& ) const = default;
};

// One settled claim. A claim appears here at most once.
struct payout
{
  std::uint64_t claim_id = 0;
  identity recipient{};
  std::uint64_t amount = 0;
  timestamp paid_at    = 0;

  bool operator==( const payout& ) const = default;
};

// Root record of one organization. Decoded from its slot at the start of an invocation and
// written back only when the invocation succeeds.
struct aggregate
{
  identity admin{};
  identity treasury{};
  std::vector< member > members;
  std::vector< claim > claims;
  std::vector< proposal > proposals;
  std::vector< ledger::member_compliance > member_compliance;
  std::optional< ledger::token_management > token_management;
  std::uint64_t regulatory_limit = 0;
  std::vector< dispute > disputes;
  std::vector< payout > payouts;

  bool initialized() const noexcept
  {
    return !admin.null();
  }

  bool operator==( const aggregate& ) const = default;
};

} // namespace mutual::ledger
