#pragma once
#include <prizepool/schema/asset_kind.hpp>
#include <prizepool/schema/primitives.hpp>

// Schema type: asset reference.
// Pool workflow: identifies what a vault holds. `contract` is only meaningful
// for token assets and stays zero for the native currency.
namespace prizepool::schema {

template <uint16_t Version>
struct asset_ref;

template <>
struct asset_ref<1> final {
  uint16_t version{1};
  asset_kind_t kind{asset_kind_t::native};
  contract_id_t contract{};

  bool operator==(const asset_ref<1>&) const = default;
};

using asset_ref_t = asset_ref<1>;

inline asset_ref_t make_native_asset() {
  return asset_ref_t{.kind = asset_kind_t::native};
}

inline asset_ref_t make_token_asset(const contract_id_t& contract) {
  return asset_ref_t{.kind = asset_kind_t::token, .contract = contract};
}

inline bool is_native(const asset_ref_t& asset) {
  return asset.kind == asset_kind_t::native;
}

}  // namespace prizepool::schema
