#pragma once
#include <trustee/schema/transaction_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trustee::schema {

void encode(const transaction_event<1>& o, ::scale::Encoder& encoder);
void decode(transaction_event<1>& o, ::scale::Decoder& decoder);

}  // namespace trustee::schema
