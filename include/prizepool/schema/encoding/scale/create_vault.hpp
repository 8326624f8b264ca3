#pragma once
#include <prizepool/schema/encoding/scale/asset_ref.hpp>
#include <prizepool/schema/create_vault.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(create_vault<1>&& o, ::scale::Encoder& encoder);
void decode(create_vault<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
