#pragma once
#include <prizepool/schema/depositor_balance.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(depositor_balance<1>&& o, ::scale::Encoder& encoder);
void decode(depositor_balance<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
