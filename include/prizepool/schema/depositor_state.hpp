#pragma once
#include <prizepool/schema/primitives.hpp>

// Schema type: depositor state.
// Pool workflow: one row per (vault, account). `slot` is the account's index
// in the vault's depositor slot table while principal is non-zero.
namespace prizepool::schema {

template <uint16_t Version>
struct depositor_state;

template <>
struct depositor_state<1> final {
  uint16_t version{1};
  amount_t principal{0};
  amount_t claimable{0};
  uint64_t slot{};
};

using depositor_state_t = depositor_state<1>;

}  // namespace prizepool::schema
