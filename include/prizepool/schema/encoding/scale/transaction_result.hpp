#pragma once
#include <prizepool/schema/encoding/scale/transaction_event.hpp>
#include <prizepool/schema/transaction_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(transaction_result<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
