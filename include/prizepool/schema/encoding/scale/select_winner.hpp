#pragma once
#include <prizepool/schema/select_winner.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(select_winner<1>&& o, ::scale::Encoder& encoder);
void decode(select_winner<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
