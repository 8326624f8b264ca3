#pragma once
#include <prizepool/schema/deposit.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(deposit<1>&& o, ::scale::Encoder& encoder);
void decode(deposit<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
