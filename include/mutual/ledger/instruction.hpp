#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <mutual/ledger/error.hpp>
#include <mutual/ledger/types.hpp>

namespace mutual::ledger {

enum class opcode : std::uint8_t
{
  join                        = 0,
  submit_claim                = 1,
  verify_claim                = 2,
  mint                        = 3,
  transfer                    = 4,
  burn                        = 5,
  create_proposal             = 6,
  vote                        = 7,
  submit_documents            = 8,
  update_compliance_status    = 9,
  check_compliance_gate       = 10,
  update_regulatory_parameter = 11,
  initialize                  = 12,
  finalize_proposal           = 13,
  submit_dispute              = 14,
  vote_dispute                = 15,
  pay_premium                 = 16,
  payout_claim                = 17
};

namespace instructions {

// Accounts: [0] ledger, [1] member
struct join
{};

// Accounts: [0] ledger, [1] claimant
struct submit_claim
{};

// Accounts: [0] ledger, [1] oracle
struct verify_claim
{
  std::uint64_t claim_index = 0;
};

// Accounts: [0] ledger, [1] mint authority (signer), [2] destination
struct mint
{
  std::uint64_t amount = 0;
};

// Accounts: [0] ledger, [1] source, [2] destination, [3] authority (signer)
struct transfer
{
  std::uint64_t amount = 0;
};

// Accounts: [0] ledger, [1] token account, [2] mint, [3] authority (signer)
struct burn
{
  std::uint64_t amount = 0;
};

// Accounts: [0] ledger, [1] proposer
struct create_proposal
{
  std::int64_t duration = 0;
  std::string description;
};

// Accounts: [0] ledger, [1] voter (signer), [2] weight source, equal to the voter
struct vote
{
  std::uint64_t proposal_index = 0;
  vote_choice choice           = vote_choice::no;
};

// Accounts: [0] ledger, [1] member
struct submit_documents
{};

// Accounts: [0] ledger, [1] member, [2] verifier (signer)
struct update_compliance_status
{
  bool kyc_approved = false;
  bool aml_approved = false;
};

// Accounts: [0] ledger, [1] member
struct check_compliance_gate
{};

// Accounts: [0] ledger, [1] admin (signer)
struct update_regulatory_parameter
{
  std::uint64_t limit = 0;
};

// Accounts: [0] ledger, [1] admin (signer), [2] treasury
struct initialize
{
  bool token_support = false;
};

// Accounts: [0] ledger
struct finalize_proposal
{
  std::uint64_t proposal_index = 0;
};

// Accounts: [0] ledger, [1] initiator, [2] respondent
struct submit_dispute
{
  std::optional< std::uint64_t > claim_id;
  std::string description;
};

// Accounts: [0] ledger, [1] voter
struct vote_dispute
{
  std::uint64_t dispute_index = 0;
  bool support                = false;
};

// Accounts: [0] ledger, [1] payer (signer, member)
struct pay_premium
{
  std::uint64_t amount = 0;
};

// Accounts: [0] ledger, [1] admin (signer), [2] claimant. The treasury signs the transaction as well.
struct payout_claim
{
  std::uint64_t claim_index = 0;
};

} // namespace instructions

using instruction = std::variant< instructions::join,
                                  instructions::submit_claim,
                                  instructions::verify_claim,
                                  instructions::mint,
                                  instructions::transfer,
                                  instructions::burn,
                                  instructions::create_proposal,
                                  instructions::vote,
                                  instructions::submit_documents,
                                  instructions::update_compliance_status,
                                  instructions::check_compliance_gate,
                                  instructions::update_regulatory_parameter,
                                  instructions::initialize,
                                  instructions::finalize_proposal,
                                  instructions::submit_dispute,
                                  instructions::vote_dispute,
                                  instructions::pay_premium,
                                  instructions::payout_claim >;

opcode opcode_of( const instruction& i ) noexcept;

result< instruction > decode_instruction( std::span< const std::byte > data );
std::vector< std::byte > encode_instruction( const instruction& i );

} // namespace mutual::ledger
