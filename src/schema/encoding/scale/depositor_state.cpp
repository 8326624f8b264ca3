#include <prizepool/schema/encoding/scale/depositor_state.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(depositor_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.principal, encoder);
  encode(o.claimable, encoder);
  encode(o.slot, encoder);
}

void decode(depositor_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.principal, decoder);
  decode(o.claimable, decoder);
  decode(o.slot, decoder);
}

}  // namespace prizepool::schema::encoding::scale
