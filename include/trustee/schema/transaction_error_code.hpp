#pragma once

#include <cstdint>

namespace trustee::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  wallet_not_initialized = 10,
  wallet_already_initialized = 11,
  authorization_denied = 12,
  proposal_missing = 13,
  proposal_not_pending = 14,
  invalid_participant = 15,
  duplicate_participant = 16,
  participant_missing = 17,
  invalid_threshold = 18,
  membership_floor_violated = 19,
  duplicate_approval = 20,
  approval_missing = 21,
  invalid_amount = 22,
  insufficient_approvals = 23,
  insufficient_balance = 24,
  transfer_failed = 25,
};

}  // namespace trustee::schema
