#pragma once
#include <trustee/schema/primitives.hpp>
#include <trustee/schema/proposal_action.hpp>
#include <trustee/schema/proposal_status.hpp>

// Schema type: proposal state.
// Wallet workflow: One entry of the append-only proposal list. Ids are
// assigned sequentially from zero and never reused.
namespace trustee::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  participant_id_t proposer;
  proposal_action_t action;
  uint32_t approvals_count{};
  proposal_status_t status{proposal_status_t::pending};
};

using proposal_state_t = proposal_state<1>;

}  // namespace trustee::schema
