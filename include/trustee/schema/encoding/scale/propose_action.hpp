#pragma once
#include <trustee/schema/propose_action.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trustee::schema {

void encode(const propose_action<1>& o, ::scale::Encoder& encoder);
void decode(propose_action<1>& o, ::scale::Decoder& decoder);

}  // namespace trustee::schema
