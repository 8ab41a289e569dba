#pragma once
#include <trustee/schema/approve_proposal.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trustee::schema {

void encode(const approve_proposal<1>& o, ::scale::Encoder& encoder);
void decode(approve_proposal<1>& o, ::scale::Decoder& decoder);

}  // namespace trustee::schema
