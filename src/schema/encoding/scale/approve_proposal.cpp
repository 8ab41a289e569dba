#include <trustee/schema/encoding/scale/approve_proposal.hpp>

namespace trustee::schema {

void encode(const approve_proposal<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
}

void decode(approve_proposal<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
}

}  // namespace trustee::schema
