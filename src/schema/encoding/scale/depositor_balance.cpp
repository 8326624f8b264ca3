#include <prizepool/schema/encoding/scale/depositor_balance.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(depositor_balance<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.principal, encoder);
  encode(o.accrued_interest, encoder);
  encode(o.claimable, encoder);
}

void decode(depositor_balance<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.principal, decoder);
  decode(o.accrued_interest, decoder);
  decode(o.claimable, decoder);
}

}  // namespace prizepool::schema::encoding::scale
