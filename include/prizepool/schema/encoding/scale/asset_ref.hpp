#pragma once
#include <prizepool/schema/asset_ref.hpp>
#include <prizepool/schema/encoding/scale/asset_kind.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(asset_ref<1>&& o, ::scale::Encoder& encoder);
void decode(asset_ref<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
