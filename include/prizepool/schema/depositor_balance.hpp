#pragma once
#include <prizepool/schema/primitives.hpp>

// Schema type: depositor balance.
// Pool workflow: principal plus the interest the principal has earned once the
// vault matured. The estimate ignores the lottery; see `claimable` for the
// settled entitlement.
namespace prizepool::schema {

template <uint16_t Version>
struct depositor_balance;

template <>
struct depositor_balance<1> final {
  uint16_t version{1};
  amount_t principal{0};
  amount_t accrued_interest{0};
  amount_t claimable{0};
};

using depositor_balance_t = depositor_balance<1>;

}  // namespace prizepool::schema
