#include <trustee/schema/encoding/scale/approval_state.hpp>

namespace trustee::schema {

void encode(const approval_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
  encode(o.participant, encoder);
  encode(o.approved, encoder);
}

void decode(approval_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
  decode(o.participant, decoder);
  decode(o.approved, decoder);
}

}  // namespace trustee::schema
