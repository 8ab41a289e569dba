#include <trustee/schema/encoding/scale/revoke_approval.hpp>

namespace trustee::schema {

void encode(const revoke_approval<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
}

void decode(revoke_approval<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
}

}  // namespace trustee::schema
