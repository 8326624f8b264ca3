#pragma once
#include <prizepool/schema/query_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(query_result<1>&& o, ::scale::Encoder& encoder);
void decode(query_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
