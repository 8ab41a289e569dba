#include <trustee/common/critical.hpp>
#include <trustee/execution/approval_ledger.hpp>
#include <trustee/schema/key/engine_keys.hpp>

using namespace trustee::schema;

namespace trustee::execution {

approval_ledger::approval_ledger(state_buffer& state, proposal_store& proposals)
    : state_{state}, proposals_{proposals} {}

bool approval_ledger::has_approved(const proposal_id_t proposal_id,
                                   const participant_id_t& participant) const {
  auto row_key =
      key::make_approval_key(state_.encoder(), proposal_id, participant);
  auto approval = state_.load<approval_state_t>(make_bytes_view(row_key));
  return approval && approval->approved;
}

void approval_ledger::record(proposal_state_t& proposal,
                             const participant_id_t& participant) {
  auto approval = approval_state_t{};
  approval.proposal_id = proposal.proposal_id;
  approval.participant = participant;
  approval.approved = true;

  auto row_key = key::make_approval_key(state_.encoder(), proposal.proposal_id,
                                    participant);
  state_.store(make_bytes_view(row_key), approval);
  auto index_key = key::make_approver_index_key(state_.encoder(), participant,
                                                proposal.proposal_id);
  state_.store(make_bytes_view(index_key), proposal.proposal_id);

  ++proposal.approvals_count;
  proposals_.save(proposal);
}

void approval_ledger::clear(proposal_state_t& proposal,
                            const participant_id_t& participant) {
  if (proposal.approvals_count == 0) {
    trustee::common::critical("approval count underflow");
  }
  auto approval = approval_state_t{};
  approval.proposal_id = proposal.proposal_id;
  approval.participant = participant;
  approval.approved = false;

  auto row_key = key::make_approval_key(state_.encoder(), proposal.proposal_id,
                                    participant);
  state_.store(make_bytes_view(row_key), approval);
  auto index_key = key::make_approver_index_key(state_.encoder(), participant,
                                                proposal.proposal_id);
  state_.erase(make_bytes_view(index_key));

  --proposal.approvals_count;
  proposals_.save(proposal);
}

uint32_t approval_ledger::count_records(const proposal_id_t proposal_id) const {
  auto count = uint32_t{};
  for (const auto& approval : records(proposal_id)) {
    if (approval.approved) {
      ++count;
    }
  }
  return count;
}

std::vector<approval_state_t> approval_ledger::records(
    const proposal_id_t proposal_id) const {
  auto prefix = key::make_approval_prefix_key(state_.encoder(), proposal_id);
  auto approvals = std::vector<approval_state_t>{};
  for (const auto& entry : state_.list_by_prefix(make_bytes_view(prefix))) {
    approvals.push_back(state_.encoder().decode<approval_state_t>(
        make_bytes_view(entry.second)));
  }
  return approvals;
}

std::vector<swept_approval> approval_ledger::sweep(
    const participant_id_t& removed) {
  auto prefix =
      key::make_approver_index_prefix_key(state_.encoder(), removed);
  auto swept = std::vector<swept_approval>{};
  for (const auto& entry : state_.list_by_prefix(make_bytes_view(prefix))) {
    auto proposal_id =
        state_.encoder().decode<proposal_id_t>(make_bytes_view(entry.second));
    auto proposal = proposals_.find(proposal_id);
    if (!proposal) {
      trustee::common::critical("approver index references missing proposal");
    }
    if (proposal->status != proposal_status_t::pending ||
        !has_approved(proposal_id, removed)) {
      state_.erase(make_bytes_view(entry.first));
      continue;
    }
    clear(*proposal, removed);
    swept.push_back(swept_approval{.proposal_id = proposal_id,
                                   .remaining = proposal->approvals_count});
  }
  return swept;
}

void approval_ledger::release(const proposal_state_t& proposal) {
  for (const auto& approval : records(proposal.proposal_id)) {
    if (!approval.approved) {
      continue;
    }
    auto index_key = key::make_approver_index_key(
        state_.encoder(), approval.participant, proposal.proposal_id);
    state_.erase(make_bytes_view(index_key));
  }
}

}  // namespace trustee::execution
