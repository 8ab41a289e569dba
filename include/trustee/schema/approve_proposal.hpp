#pragma once
#include <trustee/schema/primitives.hpp>

// Schema type: approve proposal.
// Wallet workflow: Adds the caller's vote to a pending proposal.
namespace trustee::schema {

template <uint16_t Version>
struct approve_proposal;

template <>
struct approve_proposal<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
};

using approve_proposal_t = approve_proposal<1>;

}  // namespace trustee::schema
