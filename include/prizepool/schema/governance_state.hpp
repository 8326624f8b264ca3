#pragma once
#include <prizepool/schema/primitives.hpp>

// Schema type: governance state.
// Pool workflow: the single owner (reassigns the admin) and the single admin
// (creates, funds and force-deletes vaults).
namespace prizepool::schema {

template <uint16_t Version>
struct governance_state;

template <>
struct governance_state<1> final {
  uint16_t version{1};
  account_id_t owner{};
  account_id_t admin{};
  vault_id_t next_vault_id{1};
};

using governance_state_t = governance_state<1>;

}  // namespace prizepool::schema
