#include <prizepool/schema/encoding/scale/withdraw.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(withdraw<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.vault_id, encoder);
}

void decode(withdraw<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.vault_id, decoder);
}

}  // namespace prizepool::schema::encoding::scale
