#include <prizepool/execution/settlement.hpp>
#include <prizepool/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>

namespace {

using prizepool::schema::amount_t;
using prizepool::schema::event_type_t;
using prizepool::schema::transaction_error_code;
using prizepool::testing::code_of;
using prizepool::testing::engine_fixture;
using prizepool::testing::kOneDay;
using prizepool::testing::make_account;

const auto kAlice = make_account(10);
const auto kBob = make_account(20);
const auto kCarol = make_account(30);
const auto kNative = prizepool::schema::make_native_asset();

prizepool::schema::delete_vault_t request(
    const prizepool::schema::vault_id_t vault_id) {
  return prizepool::schema::delete_vault_t{.vault_id = vault_id};
}

std::size_t count_events(const prizepool::schema::transaction_result_t& result,
                         const event_type_t type) {
  return static_cast<std::size_t>(
      std::ranges::count_if(result.events, [&](const auto& event) {
        return event.type == type;
      }));
}

}  // namespace

TEST(delete_vault, requires_admin) {
  auto fixture = engine_fixture{"prizepool_delete_auth"};
  auto vault_id = fixture.create_native_vault(kOneDay, 500);
  EXPECT_EQ(fixture.engine().delete_vault(kAlice, request(vault_id)).code,
            code_of(transaction_error_code::unauthorized));
  EXPECT_TRUE(fixture.engine().vault_summary(vault_id)->active);
  EXPECT_EQ(
      fixture.engine().delete_vault(engine_fixture::owner(), request(99)).code,
      code_of(transaction_error_code::vault_missing));
}

TEST(delete_vault, pays_principal_before_maturity) {
  auto fixture = engine_fixture{"prizepool_delete_early"};
  auto vault_id = fixture.create_native_vault(365 * kOneDay, 500);
  ASSERT_EQ(fixture.deposit_native(vault_id, kAlice, 1000).code, 0u);
  ASSERT_EQ(fixture.deposit_native(vault_id, kBob, 2000).code, 0u);

  auto result =
      fixture.engine().delete_vault(engine_fixture::owner(), request(vault_id));
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(count_events(result, event_type_t::withdrawn), 2u);
  EXPECT_EQ(count_events(result, event_type_t::vault_deleted), 1u);
  EXPECT_EQ(result.events.back().type, event_type_t::vault_deleted);
  EXPECT_EQ(fixture.gateway().pushed_to(kAlice), amount_t{1000});
  EXPECT_EQ(fixture.gateway().pushed_to(kBob), amount_t{2000});
  EXPECT_EQ(fixture.engine().reserve(kNative), amount_t{0});
}

TEST(delete_vault, pays_own_interest_after_maturity_and_deactivates) {
  auto fixture = engine_fixture{"prizepool_delete_matured"};
  auto vault_id = fixture.create_native_vault(365 * kOneDay, 500);
  ASSERT_EQ(fixture.deposit_native(vault_id, kAlice, 1000).code, 0u);
  ASSERT_EQ(fixture.deposit_native(vault_id, kBob, 2000).code, 0u);
  ASSERT_EQ(fixture.fund(kNative, 150).code, 0u);
  fixture.advance(365 * kOneDay);

  auto result =
      fixture.engine().delete_vault(engine_fixture::owner(), request(vault_id));
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(fixture.gateway().pushed_to(kAlice), amount_t{1050});
  EXPECT_EQ(fixture.gateway().pushed_to(kBob), amount_t{2100});
  EXPECT_EQ(fixture.engine().reserve(kNative), amount_t{0});

  auto summary = fixture.engine().vault_summary(vault_id);
  EXPECT_FALSE(summary->active);
  EXPECT_EQ(summary->depositor_count, 0u);
  EXPECT_EQ(summary->total_principal, amount_t{0});
  EXPECT_FALSE(fixture.engine().has_winner(vault_id));

  EXPECT_EQ(fixture.deposit_native(vault_id, kCarol, 10).code,
            code_of(transaction_error_code::vault_inactive));
  EXPECT_EQ(fixture.withdraw(vault_id, kAlice).code,
            code_of(transaction_error_code::vault_inactive));
  EXPECT_EQ(
      fixture.engine().delete_vault(engine_fixture::owner(), request(vault_id))
          .code,
      code_of(transaction_error_code::vault_inactive));
  EXPECT_EQ(fixture.engine()
                .select_winner(kAlice, prizepool::schema::select_winner_t{
                                           .vault_id = vault_id})
                .code,
            code_of(transaction_error_code::vault_inactive));
}

TEST(delete_vault, empty_vault_is_deactivated) {
  auto fixture = engine_fixture{"prizepool_delete_empty"};
  auto vault_id = fixture.create_native_vault(kOneDay, 500);
  auto result =
      fixture.engine().delete_vault(engine_fixture::owner(), request(vault_id));
  ASSERT_EQ(result.code, 0u);
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, event_type_t::vault_deleted);
  EXPECT_FALSE(fixture.engine().vault_summary(vault_id)->active);
}

TEST(delete_vault, refused_payout_stops_and_retry_pays_the_rest) {
  auto fixture = engine_fixture{"prizepool_delete_retry"};
  auto vault_id = fixture.create_native_vault(365 * kOneDay, 500);
  // Slot order is Alice, Bob, Carol; payouts run from the end.
  ASSERT_EQ(fixture.deposit_native(vault_id, kAlice, 1000).code, 0u);
  ASSERT_EQ(fixture.deposit_native(vault_id, kBob, 2000).code, 0u);
  ASSERT_EQ(fixture.deposit_native(vault_id, kCarol, 3000).code, 0u);

  fixture.gateway().refuse_pushes_to(kBob);
  auto first =
      fixture.engine().delete_vault(engine_fixture::owner(), request(vault_id));
  EXPECT_EQ(first.code, code_of(transaction_error_code::transfer_failed));
  EXPECT_EQ(count_events(first, event_type_t::withdrawn), 1u);
  EXPECT_EQ(count_events(first, event_type_t::vault_deleted), 0u);
  EXPECT_EQ(fixture.gateway().pushed_to(kCarol), amount_t{3000});
  EXPECT_EQ(fixture.gateway().pushed_to(kBob), amount_t{0});

  auto summary = fixture.engine().vault_summary(vault_id);
  EXPECT_TRUE(summary->active);
  EXPECT_EQ(summary->depositor_count, 2u);
  EXPECT_EQ(summary->total_principal, amount_t{3000});
  EXPECT_FALSE(fixture.engine().is_depositor(vault_id, kCarol));
  EXPECT_TRUE(fixture.engine().is_depositor(vault_id, kBob));
  EXPECT_TRUE(fixture.engine().is_depositor(vault_id, kAlice));
  EXPECT_EQ(fixture.engine().reserve(prizepool::schema::make_native_asset()),
            amount_t{3000});

  fixture.gateway().accept_pushes_to(kBob);
  auto second =
      fixture.engine().delete_vault(engine_fixture::owner(), request(vault_id));
  ASSERT_EQ(second.code, 0u);
  EXPECT_EQ(count_events(second, event_type_t::withdrawn), 2u);
  EXPECT_EQ(count_events(second, event_type_t::vault_deleted), 1u);
  EXPECT_EQ(fixture.gateway().pushed_to(kCarol), amount_t{3000});
  EXPECT_EQ(fixture.gateway().pushed_to(kBob), amount_t{2000});
  EXPECT_EQ(fixture.gateway().pushed_to(kAlice), amount_t{1000});
  EXPECT_FALSE(fixture.engine().vault_summary(vault_id)->active);
}

TEST(delete_vault, reserve_shortfall_stops_without_paying_twice) {
  auto fixture = engine_fixture{"prizepool_delete_shortfall"};
  auto vault_id = fixture.create_native_vault(365 * kOneDay, 10'000);
  ASSERT_EQ(fixture.deposit_native(vault_id, kAlice, 1000).code, 0u);
  ASSERT_EQ(fixture.deposit_native(vault_id, kBob, 1000).code, 0u);
  fixture.advance(365 * kOneDay);

  // Each payout is 2000; the reserve holds 2000 in total.
  auto first =
      fixture.engine().delete_vault(engine_fixture::owner(), request(vault_id));
  EXPECT_EQ(first.code,
            code_of(transaction_error_code::insufficient_pool_funds));
  EXPECT_EQ(fixture.gateway().pushed_to(kBob), amount_t{2000});
  EXPECT_EQ(fixture.gateway().pushed_to(kAlice), amount_t{0});
  EXPECT_EQ(fixture.engine().vault_summary(vault_id)->depositor_count, 1u);

  ASSERT_EQ(fixture.fund(kNative, 2000).code, 0u);
  auto second =
      fixture.engine().delete_vault(engine_fixture::owner(), request(vault_id));
  ASSERT_EQ(second.code, 0u);
  EXPECT_EQ(fixture.gateway().pushed_to(kBob), amount_t{2000});
  EXPECT_EQ(fixture.gateway().pushed_to(kAlice), amount_t{2000});
}
