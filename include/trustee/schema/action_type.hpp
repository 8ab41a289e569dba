#pragma once

#include <trustee/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: action type.
// Wallet workflow: Tag naming which governed action a proposal carries; used
// in notifications and on the command line.
namespace trustee::schema {

enum class action_type_t : uint8_t {
  transfer = 0,
  add_participant = 1,
  remove_participant = 2,
  change_threshold = 3
};

inline constexpr auto kActionTypeMappings =
    std::array{std::pair<std::string_view, action_type_t>{
                   "transfer", action_type_t::transfer},
               std::pair<std::string_view, action_type_t>{
                   "add_participant", action_type_t::add_participant},
               std::pair<std::string_view, action_type_t>{
                   "remove_participant", action_type_t::remove_participant},
               std::pair<std::string_view, action_type_t>{
                   "change_threshold", action_type_t::change_threshold}};

template <>
inline std::optional<action_type_t> try_from_string<action_type_t>(
    const std::string_view value) {
  return from_string(value, kActionTypeMappings);
}

inline constexpr std::string_view to_string(const action_type_t value) {
  return to_string(value, kActionTypeMappings).value_or("unknown");
}

}  // namespace trustee::schema
