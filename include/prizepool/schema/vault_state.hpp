#pragma once
#include <prizepool/schema/asset_ref.hpp>
#include <prizepool/schema/primitives.hpp>
#include <optional>

// Schema type: vault state.
// Pool workflow: one time-boxed pool. Creation parameters are immutable; the
// totals, depositor count and settlement fields move with the lifecycle.
namespace prizepool::schema {

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  bytes_t name;
  asset_ref_t asset;
  timestamp_seconds_t created_at{};
  duration_seconds_t duration{};
  basis_points_t interest_rate_bps{};
  bool active{true};
  amount_t total_principal{0};
  uint64_t depositor_count{};
  bool winner_selected{};
  std::optional<account_id_t> winner{std::nullopt};
  amount_t total_interest{0};

  timestamp_seconds_t maturity() const { return created_at + duration; }
  bool matured(const timestamp_seconds_t now) const {
    return now >= maturity();
  }
};

using vault_state_t = vault_state<1>;

}  // namespace prizepool::schema
