#pragma once
#include <prizepool/schema/create_vault.hpp>
#include <prizepool/schema/delete_vault.hpp>
#include <prizepool/schema/deposit.hpp>
#include <prizepool/schema/fund_reserve.hpp>
#include <prizepool/schema/primitives.hpp>
#include <prizepool/schema/select_winner.hpp>
#include <prizepool/schema/set_admin.hpp>
#include <prizepool/schema/withdraw.hpp>
#include <variant>

namespace prizepool::schema {

using transaction_payload_t = std::variant<create_vault_t,
                                           deposit_t,
                                           withdraw_t,
                                           delete_vault_t,
                                           select_winner_t,
                                           fund_reserve_t,
                                           set_admin_t>;

template <uint16_t Version>
struct transaction;

/// Call envelope. `attached_value` is the native currency sent along with
/// the call; the host has already moved it into the pool's custody.
template <>
struct transaction<1> final {
  uint16_t version{1};
  account_id_t signer{};
  amount_t attached_value{0};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace prizepool::schema
