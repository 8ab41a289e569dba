#pragma once

#include <trustee/execution/state_buffer.hpp>
#include <trustee/schema/primitives.hpp>
#include <trustee/schema/proposal_action.hpp>
#include <trustee/schema/proposal_state.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace trustee::execution {

/// Append-only proposal list with sequential ids starting at zero.
class proposal_store final {
 public:
  explicit proposal_store(state_buffer& state);

  /// Id the next created proposal receives; also the number of proposals.
  trustee::schema::proposal_id_t next_id() const;

  /// Append a pending proposal with no approvals recorded yet.
  trustee::schema::proposal_state_t create(
      const trustee::schema::participant_id_t& proposer,
      const trustee::schema::proposal_action_t& action);

  std::optional<trustee::schema::proposal_state_t> find(
      trustee::schema::proposal_id_t proposal_id) const;
  void save(const trustee::schema::proposal_state_t& proposal);

  /// Pending proposals ordered by id.
  std::vector<trustee::schema::proposal_state_t> pending() const;

 private:
  state_buffer& state_;
};

}  // namespace trustee::execution
