#include <prizepool/schema/encoding/scale/winner_info.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(winner_info<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.winner, encoder);
  encode(o.total_interest, encoder);
}

void decode(winner_info<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.winner, decoder);
  decode(o.total_interest, decoder);
}

}  // namespace prizepool::schema::encoding::scale
