#pragma once
#include <trustee/schema/approve_proposal.hpp>
#include <trustee/schema/deposit.hpp>
#include <trustee/schema/execute_proposal.hpp>
#include <trustee/schema/initialize_wallet.hpp>
#include <trustee/schema/primitives.hpp>
#include <trustee/schema/propose_action.hpp>
#include <trustee/schema/revoke_approval.hpp>
#include <variant>

namespace trustee::schema {

using transaction_payload_t = std::variant<initialize_wallet_t,
                                           propose_action_t,
                                           approve_proposal_t,
                                           revoke_approval_t,
                                           execute_proposal_t,
                                           deposit_t>;

template <uint16_t Version>
struct transaction;

// The caller is authenticated by the host before the transaction reaches
// the engine; no signature travels with it.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  participant_id_t caller{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace trustee::schema
