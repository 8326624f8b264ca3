#include <prizepool/schema/encoding/scale/asset_ref.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(asset_ref<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.kind, encoder);
  encode(o.contract, encoder);
}

void decode(asset_ref<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.kind, decoder);
  decode(o.contract, decoder);
}

}  // namespace prizepool::schema::encoding::scale
