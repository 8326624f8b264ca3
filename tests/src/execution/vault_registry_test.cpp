#include <prizepool/schema/event_type.hpp>
#include <prizepool/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <random>

namespace {

using prizepool::schema::amount_t;
using prizepool::schema::transaction_error_code;
using prizepool::testing::code_of;
using prizepool::testing::engine_fixture;
using prizepool::testing::kGenesisTime;
using prizepool::testing::kOneDay;
using prizepool::testing::make_account;
using prizepool::testing::make_hash;

const auto kAlice = make_account(10);
const auto kBob = make_account(20);
const auto kCarol = make_account(30);

}  // namespace

TEST(vault_registry, genesis_owner_is_owner_and_admin) {
  auto fixture = engine_fixture{"prizepool_registry_genesis"};
  auto governance = fixture.engine().governance();
  EXPECT_EQ(governance.owner, engine_fixture::owner());
  EXPECT_EQ(governance.admin, engine_fixture::owner());
  EXPECT_EQ(governance.next_vault_id, 1u);
}

TEST(vault_registry, create_vault_assigns_sequential_ids) {
  auto fixture = engine_fixture{"prizepool_registry_ids"};
  auto first = fixture.create_native_vault(7 * kOneDay, 500);
  auto second = fixture.create_vault(
      prizepool::schema::make_token_asset(make_hash(0x77)), 7 * kOneDay, 250);
  EXPECT_EQ(first, 1u);
  EXPECT_EQ(second, 2u);

  auto summary = fixture.engine().vault_summary(second);
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(prizepool::schema::make_string(summary->name), "weekly");
  EXPECT_EQ(summary->asset,
            prizepool::schema::make_token_asset(make_hash(0x77)));
  EXPECT_EQ(summary->interest_rate_bps, 250u);
  EXPECT_EQ(summary->created_at, prizepool::testing::kGenesisTime);
  EXPECT_EQ(summary->duration, 7 * kOneDay);
  EXPECT_EQ(summary->time_left, 7 * kOneDay);
  EXPECT_EQ(summary->total_principal, amount_t{0});
  EXPECT_EQ(summary->depositor_count, 0u);
  EXPECT_TRUE(summary->active);
  EXPECT_FALSE(summary->winner_selected);
}

TEST(vault_registry, create_vault_emits_event_with_parameters) {
  auto fixture = engine_fixture{"prizepool_registry_event"};
  auto result = fixture.engine().create_vault(
      engine_fixture::owner(),
      prizepool::schema::create_vault_t{
          .name = prizepool::schema::make_bytes(std::string_view{"monthly"}),
          .asset = prizepool::schema::make_native_asset(),
          .duration = 30 * kOneDay,
          .interest_rate_bps = 800});
  ASSERT_EQ(result.code, 0u);
  ASSERT_EQ(result.events.size(), 1u);
  const auto& event = result.events[0];
  EXPECT_EQ(event.type, prizepool::schema::event_type_t::vault_created);
  auto has = [&](std::string_view key, std::string_view value) {
    return prizepool::schema::find_attribute(event, key) ==
           std::optional<std::string_view>{value};
  };
  EXPECT_TRUE(has("vault_id", "1"));
  EXPECT_TRUE(has("name", "monthly"));
  EXPECT_TRUE(has("asset", "native"));
  EXPECT_TRUE(has("duration", std::to_string(30 * kOneDay)));
  EXPECT_TRUE(has("interest_rate_bps", "800"));
}

TEST(vault_registry, create_vault_requires_admin) {
  auto fixture = engine_fixture{"prizepool_registry_auth"};
  auto result = fixture.engine().create_vault(
      kAlice, prizepool::schema::create_vault_t{
                  .asset = prizepool::schema::make_native_asset(),
                  .duration = kOneDay,
                  .interest_rate_bps = 100});
  EXPECT_EQ(result.code, code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(result.codespace, "prizepool.create_vault");
  EXPECT_FALSE(fixture.engine().vault_summary(1).has_value());
}

TEST(vault_registry, create_vault_rejects_invalid_parameters) {
  auto fixture = engine_fixture{"prizepool_registry_params"};
  EXPECT_EQ(fixture.create_native_vault(kOneDay, 0), 0u);
  EXPECT_EQ(fixture.create_vault(prizepool::schema::make_token_asset(
                                     prizepool::schema::make_zero_hash()),
                                 kOneDay, 100),
            0u);
  EXPECT_EQ(fixture.create_native_vault(
                std::numeric_limits<uint64_t>::max() - 1000, 100),
            0u);
  EXPECT_EQ(fixture.create_native_vault(
                std::numeric_limits<uint64_t>::max() - kGenesisTime + 1, 100),
            0u);
  EXPECT_EQ(fixture.engine().governance().next_vault_id, 1u);

  auto longest = fixture.create_native_vault(
      std::numeric_limits<uint64_t>::max() - kGenesisTime, 100);
  ASSERT_EQ(longest, 1u);
  EXPECT_EQ(fixture.engine().vault_summary(longest)->time_left,
            std::numeric_limits<uint64_t>::max() - kGenesisTime);
  EXPECT_EQ(fixture.deposit_native(longest, kAlice, 10).code, 0u);
}

TEST(vault_registry, new_admin_can_create_and_old_admin_cannot) {
  auto fixture = engine_fixture{"prizepool_registry_set_admin"};
  auto denied = fixture.engine().set_admin(
      kAlice, prizepool::schema::set_admin_t{.admin = kAlice});
  EXPECT_EQ(denied.code, code_of(transaction_error_code::unauthorized));

  auto changed = fixture.engine().set_admin(
      engine_fixture::owner(), prizepool::schema::set_admin_t{.admin = kBob});
  ASSERT_EQ(changed.code, 0u);
  ASSERT_EQ(changed.events.size(), 1u);
  EXPECT_EQ(changed.events[0].type,
            prizepool::schema::event_type_t::admin_changed);
  EXPECT_EQ(fixture.engine().governance().admin, kBob);
  EXPECT_EQ(fixture.engine().governance().owner, engine_fixture::owner());

  EXPECT_EQ(fixture.create_native_vault(kOneDay, 100), 0u);
  auto created = fixture.engine().create_vault(
      kBob, prizepool::schema::create_vault_t{
                .asset = prizepool::schema::make_native_asset(),
                .duration = kOneDay,
                .interest_rate_bps = 100});
  EXPECT_EQ(created.code, 0u);
}

TEST(vault_registry, native_deposit_uses_attached_value) {
  auto fixture = engine_fixture{"prizepool_registry_native"};
  auto vault_id = fixture.create_native_vault(7 * kOneDay, 500);

  auto result = fixture.deposit_native(vault_id, kAlice, 300);
  ASSERT_EQ(result.code, 0u);
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type,
            prizepool::schema::event_type_t::deposited);

  auto again = fixture.engine().deposit(
      kAlice, 200,
      prizepool::schema::deposit_t{.vault_id = vault_id, .amount = 200});
  ASSERT_EQ(again.code, 0u);

  auto balance = fixture.engine().depositor_balance(vault_id, kAlice);
  ASSERT_TRUE(balance.has_value());
  EXPECT_EQ(balance->principal, amount_t{500});
  EXPECT_EQ(balance->accrued_interest, amount_t{0});
  EXPECT_EQ(balance->claimable, amount_t{0});
  EXPECT_EQ(fixture.engine().vault_summary(vault_id)->depositor_count, 1u);
  EXPECT_EQ(fixture.engine().reserve(prizepool::schema::make_native_asset()),
            amount_t{500});
  EXPECT_TRUE(fixture.gateway().accepted().empty());
}

TEST(vault_registry, native_deposit_rejections) {
  auto fixture = engine_fixture{"prizepool_registry_native_reject"};
  auto vault_id = fixture.create_native_vault(7 * kOneDay, 500);

  EXPECT_EQ(fixture.deposit_native(vault_id, kAlice, 0).code,
            code_of(transaction_error_code::zero_amount));
  EXPECT_EQ(fixture.engine()
                .deposit(kAlice, 100,
                         prizepool::schema::deposit_t{.vault_id = vault_id,
                                                      .amount = 99})
                .code,
            code_of(transaction_error_code::invalid_parameter));
  EXPECT_EQ(fixture.deposit_native(vault_id + 1, kAlice, 10).code,
            code_of(transaction_error_code::vault_missing));

  fixture.advance(7 * kOneDay);
  EXPECT_EQ(fixture.deposit_native(vault_id, kAlice, 10).code,
            code_of(transaction_error_code::deposit_window_closed));
  EXPECT_FALSE(fixture.engine().is_depositor(vault_id, kAlice));
  EXPECT_EQ(fixture.engine().vault_summary(vault_id)->time_left, 0u);
}

TEST(vault_registry, token_deposit_pulls_from_caller) {
  auto fixture = engine_fixture{"prizepool_registry_token"};
  auto asset = prizepool::schema::make_token_asset(make_hash(0x33));
  auto vault_id = fixture.create_vault(asset, 7 * kOneDay, 500);

  EXPECT_EQ(fixture.engine()
                .deposit(kAlice, 5,
                         prizepool::schema::deposit_t{.vault_id = vault_id,
                                                      .amount = 100})
                .code,
            code_of(transaction_error_code::unexpected_payment));
  EXPECT_EQ(fixture.engine()
                .deposit(kAlice, 0,
                         prizepool::schema::deposit_t{.vault_id = vault_id,
                                                      .amount = 0})
                .code,
            code_of(transaction_error_code::zero_amount));

  auto result = fixture.engine().deposit(
      kAlice, 0, prizepool::schema::deposit_t{.vault_id = vault_id, .amount = 100});
  ASSERT_EQ(result.code, 0u);
  auto accepted = fixture.gateway().accepted();
  ASSERT_EQ(accepted.size(), 1u);
  EXPECT_EQ(accepted[0].direction, prizepool::schema::transfer_direction_t::pull);
  EXPECT_EQ(accepted[0].account, kAlice);
  EXPECT_EQ(accepted[0].amount, amount_t{100});
  EXPECT_EQ(accepted[0].asset, asset);
  EXPECT_EQ(fixture.engine().reserve(asset), amount_t{100});
  EXPECT_EQ(fixture.engine().reserve(prizepool::schema::make_native_asset()),
            amount_t{0});
}

TEST(vault_registry, refused_pull_leaves_no_state) {
  auto fixture = engine_fixture{"prizepool_registry_refused_pull"};
  auto asset = prizepool::schema::make_token_asset(make_hash(0x33));
  auto vault_id = fixture.create_vault(asset, 7 * kOneDay, 500);
  fixture.gateway().refuse_pulls(true);

  auto result = fixture.engine().deposit(
      kAlice, 0, prizepool::schema::deposit_t{.vault_id = vault_id, .amount = 100});
  EXPECT_EQ(result.code, code_of(transaction_error_code::transfer_failed));
  EXPECT_TRUE(result.events.empty());
  EXPECT_FALSE(fixture.engine().is_depositor(vault_id, kAlice));
  EXPECT_EQ(fixture.engine().vault_summary(vault_id)->total_principal,
            amount_t{0});
  EXPECT_EQ(fixture.engine().reserve(asset), amount_t{0});
}

TEST(vault_registry, total_principal_tracks_random_deposits) {
  auto fixture = engine_fixture{"prizepool_registry_totals"};
  auto vault_id = fixture.create_native_vault(30 * kOneDay, 500);
  auto accounts = std::vector{kAlice, kBob, kCarol, make_account(40)};
  auto rng = std::mt19937{1234};
  auto pick = std::uniform_int_distribution<std::size_t>{0, accounts.size() - 1};
  auto amount = std::uniform_int_distribution<uint64_t>{1, 1'000'000};

  for (int i = 0; i < 50; ++i) {
    ASSERT_EQ(fixture.deposit_native(vault_id, accounts[pick(rng)], amount(rng))
                  .code,
              0u);
    auto sum = amount_t{0};
    for (const auto& account : accounts) {
      sum += fixture.engine().depositor_balance(vault_id, account)->principal;
    }
    EXPECT_EQ(fixture.engine().vault_summary(vault_id)->total_principal, sum);
  }
  auto listed = fixture.engine().list_depositors(vault_id);
  ASSERT_TRUE(listed.has_value());
  EXPECT_EQ(listed->size(), accounts.size());
}

TEST(vault_registry, queries_on_missing_vault) {
  auto fixture = engine_fixture{"prizepool_registry_missing"};
  EXPECT_FALSE(fixture.engine().vault_summary(9).has_value());
  EXPECT_FALSE(fixture.engine().depositor_balance(9, kAlice).has_value());
  EXPECT_FALSE(fixture.engine().list_depositors(9).has_value());
  EXPECT_FALSE(fixture.engine().winner(9).has_value());
  EXPECT_FALSE(fixture.engine().has_winner(9));
  EXPECT_FALSE(fixture.engine().is_depositor(9, kAlice));
}
