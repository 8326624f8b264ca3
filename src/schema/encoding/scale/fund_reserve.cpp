#include <prizepool/schema/encoding/scale/asset_ref.hpp>
#include <prizepool/schema/encoding/scale/fund_reserve.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(fund_reserve<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.asset, encoder);
  encode(o.amount, encoder);
}

void decode(fund_reserve<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.asset, decoder);
  decode(o.amount, decoder);
}

}  // namespace prizepool::schema::encoding::scale
