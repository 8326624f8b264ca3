#include <prizepool/schema/encoding/scale/transaction.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.signer, encoder);
  encode(o.attached_value, encoder);
  encode(o.payload, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.signer, decoder);
  decode(o.attached_value, decoder);
  decode(o.payload, decoder);
}

}  // namespace prizepool::schema::encoding::scale
