#pragma once
#include <trustee/common/critical.hpp>
#include <trustee/schema/encoding/encoder.hpp>
#include <trustee/schema/encoding/scale/approval_state.hpp>
#include <trustee/schema/encoding/scale/approve_proposal.hpp>
#include <trustee/schema/encoding/scale/deposit.hpp>
#include <trustee/schema/encoding/scale/event_record.hpp>
#include <trustee/schema/encoding/scale/execute_proposal.hpp>
#include <trustee/schema/encoding/scale/history_entry.hpp>
#include <trustee/schema/encoding/scale/initialize_wallet.hpp>
#include <trustee/schema/encoding/scale/membership_state.hpp>
#include <trustee/schema/encoding/scale/proposal_action.hpp>
#include <trustee/schema/encoding/scale/proposal_state.hpp>
#include <trustee/schema/encoding/scale/propose_action.hpp>
#include <trustee/schema/encoding/scale/revoke_approval.hpp>
#include <trustee/schema/encoding/scale/transaction.hpp>
#include <trustee/schema/encoding/scale/transaction_event.hpp>
#include <trustee/schema/encoding/scale/transaction_event_attribute.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace trustee::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  trustee::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, trustee::schema::bytes_t& out);

  template <typename T>
  T decode(const trustee::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const trustee::schema::bytes_view_t& bytes);
};

template <typename T>
trustee::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    trustee::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        trustee::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const trustee::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    trustee::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const trustee::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace trustee::schema::encoding
