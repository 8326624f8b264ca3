#include <prizepool/schema/encoding/scale/set_admin.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(set_admin<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.admin, encoder);
}

void decode(set_admin<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.admin, decoder);
}

}  // namespace prizepool::schema::encoding::scale
