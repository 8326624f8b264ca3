#pragma once
#include <prizepool/schema/asset_ref.hpp>
#include <prizepool/schema/primitives.hpp>

// Schema type: fund reserve.
// Pool workflow: admin top-up of the interest reserve for one asset. Not tied
// to a vault; every vault holding the asset pays out of the same reserve.
namespace prizepool::schema {

template <uint16_t Version>
struct fund_reserve;

template <>
struct fund_reserve<1> final {
  uint16_t version{1};
  asset_ref_t asset;
  amount_t amount{0};
};

using fund_reserve_t = fund_reserve<1>;

}  // namespace prizepool::schema
