#pragma once
#include <trustee/schema/revoke_approval.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trustee::schema {

void encode(const revoke_approval<1>& o, ::scale::Encoder& encoder);
void decode(revoke_approval<1>& o, ::scale::Decoder& decoder);

}  // namespace trustee::schema
