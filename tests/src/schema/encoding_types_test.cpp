#include <gtest/gtest.h>
#include <prizepool/schema/encoding/scale/encoder.hpp>
#include <prizepool/schema/key/engine_keys.hpp>
#include <prizepool/testing/common.hpp>

#include <algorithm>
#include <tuple>

namespace {

using prizepool::testing::make_account;
using prizepool::testing::make_hash;
using prizepool::testing::scale_encoder_t;

prizepool::schema::vault_state_t make_vault() {
  auto vault = prizepool::schema::vault_state_t{
      .vault_id = 12,
      .name = prizepool::schema::make_bytes(std::string_view{"spring"}),
      .asset = prizepool::schema::make_token_asset(make_hash(3)),
      .created_at = 1'700'000'000,
      .duration = 86'400,
      .interest_rate_bps = 750};
  vault.total_principal = prizepool::schema::amount_t{1} << 200;
  vault.depositor_count = 3;
  vault.winner_selected = true;
  vault.winner = make_account(9);
  vault.total_interest = 77;
  return vault;
}

}  // namespace

TEST(schema_encoding_types, vault_state_round_trips) {
  auto codec = scale_encoder_t{};
  auto vault = make_vault();
  auto decoded = codec.decode<prizepool::schema::vault_state_t>(
      prizepool::schema::make_bytes_view(codec.encode(vault)));
  EXPECT_EQ(decoded.vault_id, vault.vault_id);
  EXPECT_EQ(decoded.name, vault.name);
  EXPECT_EQ(decoded.asset, vault.asset);
  EXPECT_EQ(decoded.created_at, vault.created_at);
  EXPECT_EQ(decoded.duration, vault.duration);
  EXPECT_EQ(decoded.interest_rate_bps, vault.interest_rate_bps);
  EXPECT_EQ(decoded.active, vault.active);
  EXPECT_EQ(decoded.total_principal, vault.total_principal);
  EXPECT_EQ(decoded.depositor_count, vault.depositor_count);
  EXPECT_EQ(decoded.winner_selected, vault.winner_selected);
  EXPECT_EQ(decoded.winner, vault.winner);
  EXPECT_EQ(decoded.total_interest, vault.total_interest);
  EXPECT_EQ(decoded.maturity(), vault.created_at + vault.duration);
}

TEST(schema_encoding_types, transaction_round_trips_all_payload_variants) {
  auto codec = scale_encoder_t{};
  auto payloads = std::vector<prizepool::schema::transaction_payload_t>{
      prizepool::schema::create_vault_t{
          .name = prizepool::schema::make_bytes(std::string_view{"v"}),
          .asset = prizepool::schema::make_native_asset(),
          .duration = 60,
          .interest_rate_bps = 1},
      prizepool::schema::deposit_t{.vault_id = 1, .amount = 5},
      prizepool::schema::withdraw_t{.vault_id = 2},
      prizepool::schema::delete_vault_t{.vault_id = 3},
      prizepool::schema::select_winner_t{.vault_id = 4},
      prizepool::schema::fund_reserve_t{
          .asset = prizepool::schema::make_token_asset(make_hash(8)),
          .amount = 9},
      prizepool::schema::set_admin_t{.admin = make_account(5)}};

  for (const auto& payload : payloads) {
    auto tx = prizepool::schema::transaction_t{
        .signer = make_account(1), .attached_value = 42, .payload = payload};
    auto encoded = codec.encode(tx);
    auto decoded = codec.decode<prizepool::schema::transaction_t>(
        prizepool::schema::make_bytes_view(encoded));
    SCOPED_TRACE(payload.index());
    EXPECT_EQ(decoded.version, 1u);
    EXPECT_EQ(decoded.signer, tx.signer);
    EXPECT_EQ(decoded.attached_value, tx.attached_value);
    EXPECT_EQ(decoded.payload.index(), payload.index());
    EXPECT_EQ(codec.encode(decoded), encoded);
  }
}

TEST(schema_encoding_types, try_decode_rejects_truncated_bytes) {
  auto codec = scale_encoder_t{};
  auto encoded = codec.encode(make_vault());
  encoded.resize(encoded.size() - 5);
  EXPECT_FALSE(codec.try_decode<prizepool::schema::vault_state_t>(
                        prizepool::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(schema_encoding_types, encode_overload_appends_exact_payload_bytes) {
  auto codec = scale_encoder_t{};
  auto entry = prizepool::schema::depositor_state_t{
      .principal = 10, .claimable = 20, .slot = 3};
  auto encoded = codec.encode(entry);
  auto out = prizepool::schema::bytes_t{0xDE, 0xAD};
  codec.encode(entry, out);
  ASSERT_EQ(out.size(), 2u + encoded.size());
  EXPECT_TRUE(std::equal(std::begin(encoded), std::end(encoded),
                         std::begin(out) + 2));
}

TEST(schema_encoding_types, keys_are_distinct_per_component) {
  auto codec = scale_encoder_t{};
  namespace key = prizepool::schema::key;
  EXPECT_NE(key::make_vault_key(codec, 1), key::make_vault_key(codec, 2));
  EXPECT_NE(key::make_depositor_key(codec, 1, make_account(1)),
            key::make_depositor_key(codec, 1, make_account(2)));
  EXPECT_NE(key::make_depositor_key(codec, 1, make_account(1)),
            key::make_depositor_key(codec, 2, make_account(1)));
  EXPECT_NE(key::make_slot_key(codec, 1, 0), key::make_slot_key(codec, 1, 1));
  EXPECT_NE(key::make_reserve_key(codec, prizepool::schema::make_native_asset()),
            key::make_reserve_key(
                codec, prizepool::schema::make_token_asset(make_hash(1))));
}

TEST(schema_encoding_types, event_keys_parse_back) {
  auto codec = scale_encoder_t{};
  namespace key = prizepool::schema::key;
  auto event_key = key::make_event_key(codec, 77);
  EXPECT_EQ(key::parse_event_key(codec, prizepool::schema::make_bytes_view(event_key)),
            std::optional<uint64_t>{77});
  auto prefix = key::make_prefix_key(codec, key::kEventPrefix);
  EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix),
                         std::begin(event_key)));

  auto outbox_key = key::make_outbox_key(codec, 77);
  EXPECT_FALSE(
      key::parse_event_key(codec, prizepool::schema::make_bytes_view(outbox_key))
          .has_value());
}
