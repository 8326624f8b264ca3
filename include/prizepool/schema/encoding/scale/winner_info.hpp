#pragma once
#include <prizepool/schema/winner_info.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(winner_info<1>&& o, ::scale::Encoder& encoder);
void decode(winner_info<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
