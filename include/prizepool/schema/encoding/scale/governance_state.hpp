#pragma once
#include <prizepool/schema/governance_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(governance_state<1>&& o, ::scale::Encoder& encoder);
void decode(governance_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
