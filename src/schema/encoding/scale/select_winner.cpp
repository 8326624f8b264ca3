#include <prizepool/schema/encoding/scale/select_winner.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(select_winner<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.vault_id, encoder);
}

void decode(select_winner<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.vault_id, decoder);
}

}  // namespace prizepool::schema::encoding::scale
