#pragma once
#include <prizepool/schema/withdraw.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(withdraw<1>&& o, ::scale::Encoder& encoder);
void decode(withdraw<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
