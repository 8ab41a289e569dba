#pragma once
#include <trustee/schema/primitives.hpp>
#include <vector>

// Schema type: initialize wallet.
// Wallet workflow: Genesis provisioning: installs the initial participant set
// and approval threshold. Accepted once.
namespace trustee::schema {

template <uint16_t Version>
struct initialize_wallet;

template <>
struct initialize_wallet<1> final {
  uint16_t version{1};
  std::vector<participant_id_t> participants;
  uint32_t threshold{1};
};

using initialize_wallet_t = initialize_wallet<1>;

}  // namespace trustee::schema
