#include <prizepool/schema/encoding/scale/asset_ref.hpp>
#include <prizepool/schema/encoding/scale/create_vault.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(create_vault<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.asset, encoder);
  encode(o.duration, encoder);
  encode(o.interest_rate_bps, encoder);
}

void decode(create_vault<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.asset, decoder);
  decode(o.duration, decoder);
  decode(o.interest_rate_bps, decoder);
}

}  // namespace prizepool::schema::encoding::scale
