#pragma once

#include <trustee/execution/failure.hpp>
#include <trustee/execution/state_buffer.hpp>
#include <trustee/schema/membership_state.hpp>
#include <trustee/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace trustee::execution {

/// Owns the participant set and approval threshold.
///
/// Every mutator validates first and writes only when the resulting state
/// keeps at least one participant and `1 <= threshold <= |participants|`.
class membership_registry final {
 public:
  explicit membership_registry(state_buffer& state);

  bool initialized() const;
  std::optional<trustee::schema::membership_state_t> load() const;
  bool is_participant(const trustee::schema::participant_id_t& id) const;

  std::optional<failure> validate_initialize(
      const std::vector<trustee::schema::participant_id_t>& participants,
      uint32_t threshold) const;
  std::optional<failure> validate_add(
      const trustee::schema::participant_id_t& id) const;
  std::optional<failure> validate_remove(
      const trustee::schema::participant_id_t& id) const;
  std::optional<failure> validate_threshold(uint32_t threshold) const;

  std::optional<failure> initialize(
      const std::vector<trustee::schema::participant_id_t>& participants,
      uint32_t threshold);
  std::optional<failure> add(const trustee::schema::participant_id_t& id);
  std::optional<failure> remove(const trustee::schema::participant_id_t& id);
  std::optional<failure> change_threshold(uint32_t threshold);

 private:
  void save(const trustee::schema::membership_state_t& membership);

  state_buffer& state_;
};

}  // namespace trustee::execution
