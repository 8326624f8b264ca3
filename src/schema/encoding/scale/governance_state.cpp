#include <prizepool/schema/encoding/scale/governance_state.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(governance_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.admin, encoder);
  encode(o.next_vault_id, encoder);
}

void decode(governance_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.admin, decoder);
  decode(o.next_vault_id, decoder);
}

}  // namespace prizepool::schema::encoding::scale
