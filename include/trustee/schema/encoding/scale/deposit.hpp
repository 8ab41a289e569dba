#pragma once
#include <trustee/schema/deposit.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trustee::schema {

void encode(const deposit<1>& o, ::scale::Encoder& encoder);
void decode(deposit<1>& o, ::scale::Decoder& decoder);

}  // namespace trustee::schema
