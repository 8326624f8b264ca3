#include <prizepool/schema/encoding/scale/transaction_event.hpp>
#include <prizepool/schema/encoding/scale/event_record.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(event_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.recorded_at, encoder);
  encode(o.event, encoder);
}

void decode(event_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.recorded_at, decoder);
  decode(o.event, decoder);
}

}  // namespace prizepool::schema::encoding::scale
