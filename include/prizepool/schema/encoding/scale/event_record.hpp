#pragma once
#include <prizepool/schema/encoding/scale/transaction_event.hpp>
#include <prizepool/schema/event_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(event_record<1>&& o, ::scale::Encoder& encoder);
void decode(event_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
