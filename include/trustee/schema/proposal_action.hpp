#pragma once
#include <trustee/schema/action_type.hpp>
#include <trustee/schema/primitives.hpp>
#include <variant>

// Schema type: proposal action.
// Wallet workflow: The four governed actions a proposal can carry. Dispatch
// in the execution engine visits this variant exhaustively.
namespace trustee::schema {

template <uint16_t Version>
struct transfer_action;

template <>
struct transfer_action<1> final {
  uint16_t version{1};
  participant_id_t destination;
  amount_t amount;
};

template <uint16_t Version>
struct add_participant_action;

template <>
struct add_participant_action<1> final {
  uint16_t version{1};
  participant_id_t participant;
};

template <uint16_t Version>
struct remove_participant_action;

template <>
struct remove_participant_action<1> final {
  uint16_t version{1};
  participant_id_t participant;
};

template <uint16_t Version>
struct change_threshold_action;

template <>
struct change_threshold_action<1> final {
  uint16_t version{1};
  uint32_t threshold{};
};

using transfer_action_t = transfer_action<1>;
using add_participant_action_t = add_participant_action<1>;
using remove_participant_action_t = remove_participant_action<1>;
using change_threshold_action_t = change_threshold_action<1>;

using proposal_action_t = std::variant<transfer_action_t,
                                       add_participant_action_t,
                                       remove_participant_action_t,
                                       change_threshold_action_t>;

inline action_type_t action_type(const proposal_action_t& action) {
  return std::visit(
      overloaded{
          [](const transfer_action_t&) { return action_type_t::transfer; },
          [](const add_participant_action_t&) {
            return action_type_t::add_participant;
          },
          [](const remove_participant_action_t&) {
            return action_type_t::remove_participant;
          },
          [](const change_threshold_action_t&) {
            return action_type_t::change_threshold;
          }},
      action);
}

}  // namespace trustee::schema
