#pragma once

#include <trustee/schema/primitives.hpp>

// Schema type: approval state.
// Wallet workflow: Approval ledger row: whether a participant's vote on a
// proposal is currently counted.
namespace trustee::schema {

template <uint16_t Version>
struct approval_state;

template <>
struct approval_state<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  participant_id_t participant;
  bool approved{};
};

using approval_state_t = approval_state<1>;

}  // namespace trustee::schema
