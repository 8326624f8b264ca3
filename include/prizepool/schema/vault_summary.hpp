#pragma once
#include <prizepool/schema/asset_ref.hpp>
#include <prizepool/schema/primitives.hpp>

// Schema type: vault summary.
// Pool workflow: read-only projection consumed by the presentation layer.
namespace prizepool::schema {

template <uint16_t Version>
struct vault_summary;

template <>
struct vault_summary<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  bytes_t name;
  asset_ref_t asset;
  basis_points_t interest_rate_bps{};
  timestamp_seconds_t created_at{};
  duration_seconds_t duration{};
  duration_seconds_t time_left{};
  amount_t total_principal{0};
  uint64_t depositor_count{};
  bool active{};
  bool winner_selected{};
};

using vault_summary_t = vault_summary<1>;

}  // namespace prizepool::schema
