#pragma once
#include <trustee/schema/proposal_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trustee::schema {

void encode(const proposal_state<1>& o, ::scale::Encoder& encoder);
void decode(proposal_state<1>& o, ::scale::Decoder& decoder);

}  // namespace trustee::schema
