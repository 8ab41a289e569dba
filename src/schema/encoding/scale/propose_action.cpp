#include <trustee/schema/encoding/scale/proposal_action.hpp>
#include <trustee/schema/encoding/scale/propose_action.hpp>

namespace trustee::schema {

void encode(const propose_action<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.action, encoder);
}

void decode(propose_action<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.action, decoder);
}

}  // namespace trustee::schema
