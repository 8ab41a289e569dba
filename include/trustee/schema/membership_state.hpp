#pragma once

#include <trustee/schema/primitives.hpp>
#include <vector>

// Schema type: membership state.
// Wallet workflow: Governance parameters: the participant set and the number
// of distinct approvals required to execute a proposal.
namespace trustee::schema {

template <uint16_t Version>
struct membership_state;

template <>
struct membership_state<1> final {
  uint16_t version{1};
  std::vector<participant_id_t> participants;  // sorted, unique, non-null
  uint32_t threshold{1};
};

using membership_state_t = membership_state<1>;

}  // namespace trustee::schema
