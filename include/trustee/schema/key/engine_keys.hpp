#pragma once

#include <trustee/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Wallet workflow: Canonical key prefixes and key codecs for wallet state,
// history and events.
namespace trustee::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kMembershipKey{"SYS|STATE|MEMBERSHIP|"};
inline constexpr std::string_view kBalanceKey{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kProposalSeqKey{"SYS|STATE|PROPOSAL_SEQ|"};
inline constexpr std::string_view kProposalKeyPrefix{"SYS|STATE|PROPOSAL|"};
inline constexpr std::string_view kApprovalKeyPrefix{"SYS|STATE|APPROVAL|"};
inline constexpr std::string_view kApproverIndexPrefix{"SYS|STATE|APPROVER|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kEventSeqKey{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline const std::array<std::string_view, 11> kEngineKeyspaces{
    kStatePrefix,         kMembershipKey,     kBalanceKey,
    kProposalSeqKey,      kProposalKeyPrefix, kApprovalKeyPrefix,
    kApproverIndexPrefix, kNonceKeyPrefix,    kEventSeqKey,
    kHistoryPrefix,       kEventPrefix};

template <typename Encoder, typename T>
trustee::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes, so a
  // prefix of a key tuple encodes to a byte prefix of the full key.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
trustee::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
trustee::schema::bytes_t make_proposal_key(
    Encoder& encoder,
    const trustee::schema::proposal_id_t proposal_id) {
  return make_prefixed_key(encoder, kProposalKeyPrefix, proposal_id);
}

template <typename Encoder>
trustee::schema::bytes_t make_approval_key(
    Encoder& encoder,
    const trustee::schema::proposal_id_t proposal_id,
    const trustee::schema::participant_id_t& participant) {
  return make_prefixed_key(encoder, kApprovalKeyPrefix,
                           std::tuple{proposal_id, participant});
}

/// Prefix of every approval row of one proposal.
template <typename Encoder>
trustee::schema::bytes_t make_approval_prefix_key(
    Encoder& encoder,
    const trustee::schema::proposal_id_t proposal_id) {
  return make_prefixed_key(encoder, kApprovalKeyPrefix, proposal_id);
}

template <typename Encoder>
trustee::schema::bytes_t make_approver_index_key(
    Encoder& encoder,
    const trustee::schema::participant_id_t& participant,
    const trustee::schema::proposal_id_t proposal_id) {
  return make_prefixed_key(encoder, kApproverIndexPrefix,
                           std::tuple{participant, proposal_id});
}

/// Prefix of every live approval held by one participant.
template <typename Encoder>
trustee::schema::bytes_t make_approver_index_prefix_key(
    Encoder& encoder,
    const trustee::schema::participant_id_t& participant) {
  return make_prefixed_key(encoder, kApproverIndexPrefix, participant);
}

template <typename Encoder>
trustee::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const trustee::schema::participant_id_t& caller) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, caller);
}

template <typename Encoder>
trustee::schema::bytes_t make_event_key(Encoder& encoder,
                                        const uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

template <typename Encoder>
trustee::schema::bytes_t make_history_key(Encoder& encoder,
                                          const uint64_t height,
                                          const uint32_t index) {
  return make_prefixed_key(encoder, kHistoryPrefix, std::tuple{height, index});
}

}  // namespace trustee::schema::key
