#include <trustee/schema/encoding/scale/initialize_wallet.hpp>

namespace trustee::schema {

void encode(const initialize_wallet<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.participants, encoder);
  encode(o.threshold, encoder);
}

void decode(initialize_wallet<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.participants, decoder);
  decode(o.threshold, decoder);
}

}  // namespace trustee::schema
