#pragma once
#include <prizepool/schema/encoding/scale/create_vault.hpp>
#include <prizepool/schema/encoding/scale/delete_vault.hpp>
#include <prizepool/schema/encoding/scale/deposit.hpp>
#include <prizepool/schema/encoding/scale/fund_reserve.hpp>
#include <prizepool/schema/encoding/scale/select_winner.hpp>
#include <prizepool/schema/encoding/scale/set_admin.hpp>
#include <prizepool/schema/encoding/scale/withdraw.hpp>
#include <prizepool/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace prizepool::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder);
void decode(transaction<1>&& o, ::scale::Decoder& decoder);

}  // namespace prizepool::schema::encoding::scale
