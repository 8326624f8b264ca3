#pragma once
#include <prizepool/schema/encoding/scale/asset_ref.hpp>
#include <prizepool/schema/encoding/scale/transfer_direction.hpp>
#include <prizepool/schema/transfer_request.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(transfer_request<1>&& o, ::scale::Encoder& encoder);
void decode(transfer_request<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
