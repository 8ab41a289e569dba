#include <trustee/schema/encoding/scale/approve_proposal.hpp>
#include <trustee/schema/encoding/scale/deposit.hpp>
#include <trustee/schema/encoding/scale/execute_proposal.hpp>
#include <trustee/schema/encoding/scale/initialize_wallet.hpp>
#include <trustee/schema/encoding/scale/propose_action.hpp>
#include <trustee/schema/encoding/scale/revoke_approval.hpp>
#include <trustee/schema/encoding/scale/transaction.hpp>

namespace trustee::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.caller, encoder);
  encode(o.payload, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.caller, decoder);
  decode(o.payload, decoder);
}

}  // namespace trustee::schema
