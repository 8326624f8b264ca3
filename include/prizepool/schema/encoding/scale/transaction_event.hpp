#pragma once
#include <prizepool/schema/encoding/scale/event_type.hpp>
#include <prizepool/schema/encoding/scale/transaction_event_attribute.hpp>
#include <prizepool/schema/transaction_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(transaction_event<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
