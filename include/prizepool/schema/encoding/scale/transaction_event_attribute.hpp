#pragma once
#include <prizepool/schema/transaction_event_attribute.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(transaction_event_attribute<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_event_attribute<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
