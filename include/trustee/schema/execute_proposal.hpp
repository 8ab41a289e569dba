#pragma once
#include <trustee/schema/primitives.hpp>

// Schema type: execute proposal.
// Wallet workflow: Applies a pending proposal whose approval count has
// reached the threshold.
namespace trustee::schema {

template <uint16_t Version>
struct execute_proposal;

template <>
struct execute_proposal<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
};

using execute_proposal_t = execute_proposal<1>;

}  // namespace trustee::schema
