#include <trustee/schema/encoding/scale/proposal_action.hpp>
#include <trustee/schema/encoding/scale/proposal_state.hpp>

namespace trustee::schema {

void encode(const proposal_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
  encode(o.proposer, encoder);
  encode(o.action, encoder);
  encode(o.approvals_count, encoder);
  encode(o.status, encoder);
}

void decode(proposal_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
  decode(o.proposer, decoder);
  decode(o.action, decoder);
  decode(o.approvals_count, decoder);
  decode(o.status, decoder);
}

}  // namespace trustee::schema
