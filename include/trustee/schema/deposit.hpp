#pragma once
#include <trustee/schema/primitives.hpp>

// Schema type: deposit.
// Wallet workflow: Inbound value credited to the custodied balance. The
// sender is the transaction caller; no authorization applies.
namespace trustee::schema {

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
  amount_t amount;
};

using deposit_t = deposit<1>;

}  // namespace trustee::schema
