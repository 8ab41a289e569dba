#include <trustee/schema/encoding/scale/membership_state.hpp>

namespace trustee::schema {

void encode(const membership_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.participants, encoder);
  encode(o.threshold, encoder);
}

void decode(membership_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.participants, decoder);
  decode(o.threshold, decoder);
}

}  // namespace trustee::schema
