#pragma once
#include <trustee/schema/approval_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trustee::schema {

void encode(const approval_state<1>& o, ::scale::Encoder& encoder);
void decode(approval_state<1>& o, ::scale::Decoder& decoder);

}  // namespace trustee::schema
