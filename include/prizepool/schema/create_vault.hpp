#pragma once
#include <prizepool/schema/asset_ref.hpp>
#include <prizepool/schema/primitives.hpp>

namespace prizepool::schema {

template <uint16_t Version>
struct create_vault;

template <>
struct create_vault<1> final {
  uint16_t version{1};
  bytes_t name;
  asset_ref_t asset;
  duration_seconds_t duration{};
  basis_points_t interest_rate_bps{};
};

using create_vault_t = create_vault<1>;

}  // namespace prizepool::schema
