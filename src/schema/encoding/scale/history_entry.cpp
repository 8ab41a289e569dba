#include <trustee/schema/encoding/scale/history_entry.hpp>

namespace trustee::schema {

void encode(const history_entry<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.height, encoder);
  encode(o.index, encoder);
  encode(o.code, encoder);
  encode(o.tx, encoder);
}

void decode(history_entry<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.height, decoder);
  decode(o.index, decoder);
  decode(o.code, decoder);
  decode(o.tx, decoder);
}

}  // namespace trustee::schema
