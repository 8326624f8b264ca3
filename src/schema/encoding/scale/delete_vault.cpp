#include <prizepool/schema/encoding/scale/delete_vault.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(delete_vault<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.vault_id, encoder);
}

void decode(delete_vault<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.vault_id, decoder);
}

}  // namespace prizepool::schema::encoding::scale
