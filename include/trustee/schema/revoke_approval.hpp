#pragma once
#include <trustee/schema/primitives.hpp>

// Schema type: revoke approval.
// Wallet workflow: Withdraws the caller's vote from a pending proposal.
namespace trustee::schema {

template <uint16_t Version>
struct revoke_approval;

template <>
struct revoke_approval<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
};

using revoke_approval_t = revoke_approval<1>;

}  // namespace trustee::schema
