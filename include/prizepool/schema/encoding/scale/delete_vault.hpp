#pragma once
#include <prizepool/schema/delete_vault.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(delete_vault<1>&& o, ::scale::Encoder& encoder);
void decode(delete_vault<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
