#pragma once
#include <prizepool/schema/primitives.hpp>

// Schema type: deposit.
// Pool workflow: for native vaults the contribution is the attached value;
// `amount` may be left at zero or must repeat it.
namespace prizepool::schema {

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  amount_t amount{0};
};

using deposit_t = deposit<1>;

}  // namespace prizepool::schema
