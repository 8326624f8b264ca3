#pragma once
#include <prizepool/schema/encoding/scale/asset_ref.hpp>
#include <prizepool/schema/vault_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(vault_state<1>&& o, ::scale::Encoder& encoder);
void decode(vault_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
