#pragma once

#include <cstdint>

namespace prizepool::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  unauthorized = 10,
  invalid_parameter = 11,
  vault_missing = 12,
  vault_inactive = 13,
  deposit_window_closed = 14,
  zero_amount = 15,
  unexpected_payment = 16,
  transfer_failed = 17,
  no_deposit = 18,
  no_depositors = 19,
  insufficient_pool_funds = 20,
  not_yet_settled = 21,
  not_matured = 22,
  winner_already_selected = 23,
  reentrant_call = 24,
};

}  // namespace prizepool::schema
