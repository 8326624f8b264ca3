#pragma once
#include <prizepool/schema/encoding/scale/asset_ref.hpp>
#include <prizepool/schema/fund_reserve.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(fund_reserve<1>&& o, ::scale::Encoder& encoder);
void decode(fund_reserve<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
