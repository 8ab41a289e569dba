#include <trustee/schema/encoding/scale/proposal_action.hpp>

namespace trustee::schema {

void encode(const transfer_action<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.destination, encoder);
  encode(o.amount, encoder);
}

void decode(transfer_action<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.destination, decoder);
  decode(o.amount, decoder);
}

void encode(const add_participant_action<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.participant, encoder);
}

void decode(add_participant_action<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.participant, decoder);
}

void encode(const remove_participant_action<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.participant, encoder);
}

void decode(remove_participant_action<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.participant, decoder);
}

void encode(const change_threshold_action<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.threshold, encoder);
}

void decode(change_threshold_action<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.threshold, decoder);
}

}  // namespace trustee::schema
