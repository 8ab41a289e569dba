#pragma once
#include <trustee/schema/execute_proposal.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trustee::schema {

void encode(const execute_proposal<1>& o, ::scale::Encoder& encoder);
void decode(execute_proposal<1>& o, ::scale::Decoder& decoder);

}  // namespace trustee::schema
