#include <prizepool/schema/encoding/scale/deposit.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(deposit<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.vault_id, encoder);
  encode(o.amount, encoder);
}

void decode(deposit<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.vault_id, decoder);
  decode(o.amount, decoder);
}

}  // namespace prizepool::schema::encoding::scale
