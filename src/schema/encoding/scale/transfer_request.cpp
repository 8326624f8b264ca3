#include <prizepool/schema/encoding/scale/asset_ref.hpp>
#include <prizepool/schema/encoding/scale/transfer_request.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(transfer_request<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.direction, encoder);
  encode(o.asset, encoder);
  encode(o.account, encoder);
  encode(o.amount, encoder);
  encode(o.vault_id, encoder);
}

void decode(transfer_request<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.direction, decoder);
  decode(o.asset, decoder);
  decode(o.account, decoder);
  decode(o.amount, decoder);
  decode(o.vault_id, decoder);
}

}  // namespace prizepool::schema::encoding::scale
