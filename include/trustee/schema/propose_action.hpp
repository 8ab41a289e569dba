#pragma once
#include <trustee/schema/primitives.hpp>
#include <trustee/schema/proposal_action.hpp>

// Schema type: propose action.
// Wallet workflow: Creates a pending proposal for one governed action and
// records the proposer's approval.
namespace trustee::schema {

template <uint16_t Version>
struct propose_action;

template <>
struct propose_action<1> final {
  uint16_t version{1};
  proposal_action_t action;
};

using propose_action_t = propose_action<1>;

}  // namespace trustee::schema
