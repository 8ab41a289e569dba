#pragma once

#include <trustee/schema/transaction_event.hpp>
#include <cstdint>

namespace trustee::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace trustee::schema
