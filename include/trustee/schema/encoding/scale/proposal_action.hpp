#pragma once
#include <trustee/schema/proposal_action.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trustee::schema {

void encode(const transfer_action<1>& o, ::scale::Encoder& encoder);
void decode(transfer_action<1>& o, ::scale::Decoder& decoder);

void encode(const add_participant_action<1>& o, ::scale::Encoder& encoder);
void decode(add_participant_action<1>& o, ::scale::Decoder& decoder);

void encode(const remove_participant_action<1>& o, ::scale::Encoder& encoder);
void decode(remove_participant_action<1>& o, ::scale::Decoder& decoder);

void encode(const change_threshold_action<1>& o, ::scale::Encoder& encoder);
void decode(change_threshold_action<1>& o, ::scale::Decoder& decoder);

}  // namespace trustee::schema
