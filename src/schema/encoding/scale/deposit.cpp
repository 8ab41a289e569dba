#include <trustee/schema/encoding/scale/deposit.hpp>

namespace trustee::schema {

void encode(const deposit<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.amount, encoder);
}

void decode(deposit<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.amount, decoder);
}

}  // namespace trustee::schema
