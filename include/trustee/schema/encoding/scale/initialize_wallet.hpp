#pragma once
#include <trustee/schema/initialize_wallet.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trustee::schema {

void encode(const initialize_wallet<1>& o, ::scale::Encoder& encoder);
void decode(initialize_wallet<1>& o, ::scale::Decoder& decoder);

}  // namespace trustee::schema
