#include <trustee/execution/proposal_store.hpp>
#include <trustee/schema/key/engine_keys.hpp>
#include <algorithm>

using namespace trustee::schema;

namespace trustee::execution {

proposal_store::proposal_store(state_buffer& state) : state_{state} {}

proposal_id_t proposal_store::next_id() const {
  auto row_key = key::make_prefix_key(state_.encoder(), key::kProposalSeqKey);
  return state_.load<proposal_id_t>(make_bytes_view(row_key)).value_or(0);
}

proposal_state_t proposal_store::create(const participant_id_t& proposer,
                                        const proposal_action_t& action) {
  auto proposal = proposal_state_t{};
  proposal.proposal_id = next_id();
  proposal.proposer = proposer;
  proposal.action = action;
  proposal.approvals_count = 0;
  proposal.status = proposal_status_t::pending;
  save(proposal);

  auto seq_key = key::make_prefix_key(state_.encoder(), key::kProposalSeqKey);
  state_.store(make_bytes_view(seq_key), proposal.proposal_id + 1);
  return proposal;
}

std::optional<proposal_state_t> proposal_store::find(
    const proposal_id_t proposal_id) const {
  auto row_key = key::make_proposal_key(state_.encoder(), proposal_id);
  return state_.load<proposal_state_t>(make_bytes_view(row_key));
}

void proposal_store::save(const proposal_state_t& proposal) {
  auto row_key = key::make_proposal_key(state_.encoder(), proposal.proposal_id);
  state_.store(make_bytes_view(row_key), proposal);
}

std::vector<proposal_state_t> proposal_store::pending() const {
  auto prefix = key::make_prefix_key(state_.encoder(), key::kProposalKeyPrefix);
  auto proposals = std::vector<proposal_state_t>{};
  for (const auto& entry : state_.list_by_prefix(make_bytes_view(prefix))) {
    auto proposal = state_.encoder().decode<proposal_state_t>(
        make_bytes_view(entry.second));
    if (proposal.status == proposal_status_t::pending) {
      proposals.push_back(std::move(proposal));
    }
  }
  // Ids are little-endian in the key, so key order is not id order.
  std::ranges::sort(proposals, {}, &proposal_state_t::proposal_id);
  return proposals;
}

}  // namespace trustee::execution
