#pragma once

#include <trustee/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: proposal status.
// Wallet workflow: Proposal lifecycle. A proposal is created pending and
// moves to executed exactly once; executed is terminal.
namespace trustee::schema {

enum class proposal_status_t : uint8_t { pending = 0, executed = 1 };

inline constexpr auto kProposalStatusMappings =
    std::array{std::pair<std::string_view, proposal_status_t>{
                   "pending", proposal_status_t::pending},
               std::pair<std::string_view, proposal_status_t>{
                   "executed", proposal_status_t::executed}};

template <>
inline std::optional<proposal_status_t> try_from_string<proposal_status_t>(
    const std::string_view value) {
  return from_string(value, kProposalStatusMappings);
}

inline constexpr std::string_view to_string(const proposal_status_t value) {
  return to_string(value, kProposalStatusMappings).value_or("unknown");
}

}  // namespace trustee::schema
