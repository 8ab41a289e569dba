#include <trustee/execution/membership_registry.hpp>
#include <trustee/schema/key/engine_keys.hpp>
#include <algorithm>
#include <iterator>
#include <string>

using namespace trustee::schema;

namespace trustee::execution {

namespace {

bytes_t membership_key(state_buffer& state) {
  return key::make_prefix_key(state.encoder(), key::kMembershipKey);
}

std::optional<failure> not_initialized() {
  return fail(transaction_error_code::wallet_not_initialized,
              "wallet not initialized");
}

bool contains(const membership_state_t& membership,
              const participant_id_t& id) {
  return std::ranges::binary_search(membership.participants, id);
}

}  // namespace

membership_registry::membership_registry(state_buffer& state)
    : state_{state} {}

bool membership_registry::initialized() const {
  return load().has_value();
}

std::optional<membership_state_t> membership_registry::load() const {
  auto row_key = membership_key(state_);
  return state_.load<membership_state_t>(make_bytes_view(row_key));
}

bool membership_registry::is_participant(const participant_id_t& id) const {
  auto membership = load();
  return membership && contains(*membership, id);
}

std::optional<failure> membership_registry::validate_initialize(
    const std::vector<participant_id_t>& participants,
    const uint32_t threshold) const {
  if (initialized()) {
    return fail(transaction_error_code::wallet_already_initialized,
                "wallet already initialized");
  }
  if (participants.empty()) {
    return fail(transaction_error_code::membership_floor_violated,
                "participant set is empty");
  }
  if (std::ranges::any_of(participants, is_null)) {
    return fail(transaction_error_code::invalid_participant,
                "null participant identity");
  }
  auto sorted = participants;
  std::ranges::sort(sorted);
  if (std::adjacent_find(std::begin(sorted), std::end(sorted)) !=
      std::end(sorted)) {
    return fail(transaction_error_code::duplicate_participant,
                "participant listed twice");
  }
  if (threshold < 1 || threshold > participants.size()) {
    return fail(transaction_error_code::invalid_threshold,
                "threshold out of range",
                "threshold " + std::to_string(threshold) + " with " +
                    std::to_string(participants.size()) + " participant(s)");
  }
  return std::nullopt;
}

std::optional<failure> membership_registry::validate_add(
    const participant_id_t& id) const {
  auto membership = load();
  if (!membership) {
    return not_initialized();
  }
  if (is_null(id)) {
    return fail(transaction_error_code::invalid_participant,
                "null participant identity");
  }
  if (contains(*membership, id)) {
    return fail(transaction_error_code::duplicate_participant,
                "participant already present", to_hex(id));
  }
  return std::nullopt;
}

std::optional<failure> membership_registry::validate_remove(
    const participant_id_t& id) const {
  auto membership = load();
  if (!membership) {
    return not_initialized();
  }
  if (!contains(*membership, id)) {
    return fail(transaction_error_code::participant_missing,
                "participant not present", to_hex(id));
  }
  auto remaining = membership->participants.size() - 1;
  if (remaining < 1) {
    return fail(transaction_error_code::membership_floor_violated,
                "removal would leave no participants");
  }
  if (membership->threshold > remaining) {
    return fail(transaction_error_code::membership_floor_violated,
                "removal would leave threshold above participant count",
                "threshold " + std::to_string(membership->threshold) +
                    " with " + std::to_string(remaining) +
                    " remaining participant(s)");
  }
  return std::nullopt;
}

std::optional<failure> membership_registry::validate_threshold(
    const uint32_t threshold) const {
  auto membership = load();
  if (!membership) {
    return not_initialized();
  }
  if (threshold < 1 || threshold > membership->participants.size()) {
    return fail(transaction_error_code::invalid_threshold,
                "threshold out of range",
                "threshold " + std::to_string(threshold) + " with " +
                    std::to_string(membership->participants.size()) +
                    " participant(s)");
  }
  return std::nullopt;
}

std::optional<failure> membership_registry::initialize(
    const std::vector<participant_id_t>& participants,
    const uint32_t threshold) {
  if (auto rejected = validate_initialize(participants, threshold)) {
    return rejected;
  }
  auto membership = membership_state_t{};
  membership.participants = participants;
  std::ranges::sort(membership.participants);
  membership.threshold = threshold;
  save(membership);
  return std::nullopt;
}

std::optional<failure> membership_registry::add(const participant_id_t& id) {
  if (auto rejected = validate_add(id)) {
    return rejected;
  }
  auto membership = load().value();
  auto position = std::ranges::lower_bound(membership.participants, id);
  membership.participants.insert(position, id);
  save(membership);
  return std::nullopt;
}

std::optional<failure> membership_registry::remove(
    const participant_id_t& id) {
  if (auto rejected = validate_remove(id)) {
    return rejected;
  }
  auto membership = load().value();
  auto position = std::ranges::lower_bound(membership.participants, id);
  membership.participants.erase(position);
  save(membership);
  return std::nullopt;
}

std::optional<failure> membership_registry::change_threshold(
    const uint32_t threshold) {
  if (auto rejected = validate_threshold(threshold)) {
    return rejected;
  }
  auto membership = load().value();
  membership.threshold = threshold;
  save(membership);
  return std::nullopt;
}

void membership_registry::save(const membership_state_t& membership) {
  auto row_key = membership_key(state_);
  state_.store(make_bytes_view(row_key), membership);
}

}  // namespace trustee::execution
