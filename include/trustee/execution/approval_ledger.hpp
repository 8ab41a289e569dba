#pragma once

#include <trustee/execution/proposal_store.hpp>
#include <trustee/execution/state_buffer.hpp>
#include <trustee/schema/approval_state.hpp>
#include <trustee/schema/primitives.hpp>
#include <trustee/schema/proposal_state.hpp>
#include <cstdint>
#include <vector>

namespace trustee::execution {

/// Approval count left on a pending proposal after a sweep cleared a vote.
struct swept_approval final {
  trustee::schema::proposal_id_t proposal_id{};
  uint32_t remaining{};
};

/// Per-proposal, per-participant approval relation.
///
/// Live approvals are mirrored in an approver index
/// (`APPROVER|participant|proposal_id`) so a removed participant's votes can be
/// swept without scanning every proposal. Index rows exist only for approvals
/// that are currently counted on a pending proposal.
class approval_ledger final {
 public:
  approval_ledger(state_buffer& state, proposal_store& proposals);

  bool has_approved(trustee::schema::proposal_id_t proposal_id,
                    const trustee::schema::participant_id_t& participant) const;

  /// Set the record, bump `approvals_count` and persist the proposal.
  void record(trustee::schema::proposal_state_t& proposal,
              const trustee::schema::participant_id_t& participant);

  /// Clear the record, decrement `approvals_count` and persist the proposal.
  void clear(trustee::schema::proposal_state_t& proposal,
             const trustee::schema::participant_id_t& participant);

  /// Number of counted approval records for a proposal.
  uint32_t count_records(trustee::schema::proposal_id_t proposal_id) const;
  std::vector<trustee::schema::approval_state_t> records(
      trustee::schema::proposal_id_t proposal_id) const;

  /// Clear every live approval `removed` holds on a pending proposal.
  std::vector<swept_approval> sweep(
      const trustee::schema::participant_id_t& removed);

  /// Drop index rows of a proposal that left the pending state.
  void release(const trustee::schema::proposal_state_t& proposal);

 private:
  state_buffer& state_;
  proposal_store& proposals_;
};

}  // namespace trustee::execution
