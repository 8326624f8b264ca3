#include <prizepool/schema/encoding/scale/asset_ref.hpp>
#include <prizepool/schema/encoding/scale/vault_summary.hpp>

using namespace prizepool::schema;

namespace prizepool::schema::encoding::scale {

void encode(vault_summary<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.vault_id, encoder);
  encode(o.name, encoder);
  encode(o.asset, encoder);
  encode(o.interest_rate_bps, encoder);
  encode(o.created_at, encoder);
  encode(o.duration, encoder);
  encode(o.time_left, encoder);
  encode(o.total_principal, encoder);
  encode(o.depositor_count, encoder);
  encode(o.active, encoder);
  encode(o.winner_selected, encoder);
}

void decode(vault_summary<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.vault_id, decoder);
  decode(o.name, decoder);
  decode(o.asset, decoder);
  decode(o.interest_rate_bps, decoder);
  decode(o.created_at, decoder);
  decode(o.duration, decoder);
  decode(o.time_left, decoder);
  decode(o.total_principal, decoder);
  decode(o.depositor_count, decoder);
  decode(o.active, decoder);
  decode(o.winner_selected, decoder);
}

}  // namespace prizepool::schema::encoding::scale
