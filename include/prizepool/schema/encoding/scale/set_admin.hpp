#pragma once
#include <prizepool/schema/set_admin.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(set_admin<1>&& o, ::scale::Encoder& encoder);
void decode(set_admin<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
