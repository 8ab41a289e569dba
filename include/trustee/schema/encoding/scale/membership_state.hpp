#pragma once
#include <trustee/schema/membership_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trustee::schema {

void encode(const membership_state<1>& o, ::scale::Encoder& encoder);
void decode(membership_state<1>& o, ::scale::Decoder& decoder);

}  // namespace trustee::schema
