#pragma once

#include <prizepool/execution/hooks.hpp>
#include <prizepool/execution/staged_writes.hpp>
#include <prizepool/execution/vault_guard.hpp>
#include <prizepool/schema/create_vault.hpp>
#include <prizepool/schema/delete_vault.hpp>
#include <prizepool/schema/deposit.hpp>
#include <prizepool/schema/depositor_balance.hpp>
#include <prizepool/schema/depositor_state.hpp>
#include <prizepool/schema/encoding/encoder.hpp>
#include <prizepool/schema/event_record.hpp>
#include <prizepool/schema/fund_reserve.hpp>
#include <prizepool/schema/governance_state.hpp>
#include <prizepool/schema/primitives.hpp>
#include <prizepool/schema/query_result.hpp>
#include <prizepool/schema/select_winner.hpp>
#include <prizepool/schema/set_admin.hpp>
#include <prizepool/schema/transaction.hpp>
#include <prizepool/schema/transaction_error_code.hpp>
#include <prizepool/schema/transaction_event.hpp>
#include <prizepool/schema/transaction_result.hpp>
#include <prizepool/schema/vault_state.hpp>
#include <prizepool/schema/vault_summary.hpp>
#include <prizepool/schema/winner_info.hpp>
#include <prizepool/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace prizepool::execution {

struct engine_options final {
  /// Recorded as both owner and administrator when the database is empty.
  prizepool::schema::account_id_t genesis_owner{};
};

/// Vault registry and settlement engine.
///
/// Every mutating call returns a transaction result carrying a numeric code,
/// a codespace and the events it recorded. State for one operation is staged
/// and committed atomically before any outbound transfer; a refused transfer
/// restores the previous state.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// Loads governance and the rolling state digest from storage, seeding
  /// governance from `options.genesis_owner` on first start.
  explicit engine(
      prizepool::schema::encoding::encoder<
          prizepool::schema::encoding::scale_encoder_tag>& encoder,
      prizepool::storage::storage<prizepool::storage::rocksdb_storage_tag>&
          storage,
      const engine_options& options);

  /// Decode a SCALE transaction envelope and execute it.
  prizepool::schema::transaction_result_t execute(
      const prizepool::schema::bytes_view_t& raw_tx);

  /// Dispatch a decoded transaction to its operation.
  prizepool::schema::transaction_result_t execute(
      const prizepool::schema::transaction_t& tx);

  /// Administrator only. Result data is the SCALE-encoded new vault id.
  prizepool::schema::transaction_result_t create_vault(
      const prizepool::schema::account_id_t& signer,
      const prizepool::schema::create_vault_t& payload);

  /// Add to the caller's principal while the deposit window is open.
  ///
  /// Native vaults take `attached_value` as the contribution. Token vaults
  /// pull `payload.amount` from the caller through the asset transfer hook.
  prizepool::schema::transaction_result_t deposit(
      const prizepool::schema::account_id_t& signer,
      const prizepool::schema::amount_t& attached_value,
      const prizepool::schema::deposit_t& payload);

  /// Pay out the caller's claim and remove it from the vault.
  ///
  /// The first post-maturity withdraw settles the vault. Result data is the
  /// SCALE-encoded amount paid.
  prizepool::schema::transaction_result_t withdraw(
      const prizepool::schema::account_id_t& signer,
      const prizepool::schema::withdraw_t& payload);

  /// Administrator only. Pays every depositor out, last slot first, then
  /// deactivates the vault.
  ///
  /// Stops at the first refused payout; paid depositors stay paid and a
  /// later call continues with the rest.
  prizepool::schema::transaction_result_t delete_vault(
      const prizepool::schema::account_id_t& signer,
      const prizepool::schema::delete_vault_t& payload);

  /// Run the winner draw for a matured vault. Any caller.
  prizepool::schema::transaction_result_t select_winner(
      const prizepool::schema::account_id_t& signer,
      const prizepool::schema::select_winner_t& payload);

  /// Administrator only. Tops up the pool reserve of one asset.
  prizepool::schema::transaction_result_t fund_reserve(
      const prizepool::schema::account_id_t& signer,
      const prizepool::schema::amount_t& attached_value,
      const prizepool::schema::fund_reserve_t& payload);

  /// Owner only. Replaces the administrator.
  prizepool::schema::transaction_result_t set_admin(
      const prizepool::schema::account_id_t& signer,
      const prizepool::schema::set_admin_t& payload);

  std::optional<prizepool::schema::vault_summary_t> vault_summary(
      prizepool::schema::vault_id_t vault_id) const;

  /// Principal, claimable and the interest estimate of one depositor.
  ///
  /// The estimate is `interest(principal)` once the vault has matured and
  /// zero before.
  std::optional<prizepool::schema::depositor_balance_t> depositor_balance(
      prizepool::schema::vault_id_t vault_id,
      const prizepool::schema::account_id_t& account) const;

  std::optional<std::vector<prizepool::schema::account_id_t>> list_depositors(
      prizepool::schema::vault_id_t vault_id) const;

  bool is_depositor(prizepool::schema::vault_id_t vault_id,
                    const prizepool::schema::account_id_t& account) const;

  /// Winner and pot. std::nullopt until the draw has run.
  std::optional<prizepool::schema::winner_info_t> winner(
      prizepool::schema::vault_id_t vault_id) const;

  bool has_winner(prizepool::schema::vault_id_t vault_id) const;

  prizepool::schema::amount_t reserve(
      const prizepool::schema::asset_ref_t& asset) const;

  prizepool::schema::governance_state_t governance() const;

  /// Recorded events with ids in the inclusive range.
  std::vector<prizepool::schema::event_record_t> events(uint64_t from_id,
                                                        uint64_t to_id) const;

  /// Rolling BLAKE3 digest over every committed operation.
  prizepool::schema::hash32_t state_root() const;

  /// Execute a read-path query by route.
  prizepool::schema::query_result_t query(
      std::string_view path,
      const prizepool::schema::bytes_view_t& data) const;

  void set_asset_transfer(asset_transfer_t transfer);
  void set_time_source(time_source_t time_source);
  void set_randomness_beacon(randomness_beacon_t beacon);

 private:
  enum class reserve_change { credit, debit };

  /// Caller-side outcome of a reserve-adjusted commit.
  enum class commit_status { committed, insufficient_reserve };

  prizepool::schema::timestamp_seconds_t now() const;
  prizepool::schema::hash32_t sample_beacon() const;
  bool transfer(const prizepool::schema::transfer_request_t& request) const;

  std::optional<prizepool::schema::governance_state_t> load_governance() const;
  bool is_admin(const prizepool::schema::account_id_t& account) const;

  /// Resolve the amount contributed by `signer` to `asset`, pulling token
  /// funds when needed. Returns an error code when the contribution is
  /// rejected.
  std::optional<prizepool::schema::transaction_error_code> collect(
      const prizepool::schema::account_id_t& signer,
      const prizepool::schema::asset_ref_t& asset,
      const prizepool::schema::amount_t& attached_value,
      const prizepool::schema::amount_t& requested,
      prizepool::schema::vault_id_t vault_id,
      prizepool::schema::amount_t& amount);

  /// Select the winner and assign every depositor its claim.
  void settle(staged_writes& staged,
              prizepool::schema::vault_state_t& vault,
              prizepool::schema::timestamp_seconds_t current_time,
              std::vector<prizepool::schema::transaction_event_t>& events);

  /// Announce a draw once its writes are committed.
  void log_settlement(const prizepool::schema::vault_state_t& vault,
                      uint64_t depositors) const;

  /// Drop a depositor row, moving the last slot into its place.
  void remove_depositor(staged_writes& staged,
                        prizepool::schema::vault_state_t& vault,
                        const prizepool::schema::account_id_t& account,
                        const prizepool::schema::depositor_state_t& entry);

  /// Commit staged writes together with a reserve adjustment.
  commit_status commit(const staged_writes& staged,
                       const prizepool::schema::asset_ref_t& asset,
                       reserve_change change,
                       const prizepool::schema::amount_t& amount);

  /// Undo a committed write set and return a debited amount to the reserve.
  void revert(const staged_writes& staged,
              const prizepool::schema::asset_ref_t& asset,
              const prizepool::schema::amount_t& debited);

  /// Persist events, fold them into the state digest and attach them to the
  /// result.
  void record(prizepool::schema::transaction_result_t& result,
              std::vector<prizepool::schema::transaction_event_t> events);

  void load_persisted_state(const engine_options& options);

  prizepool::schema::encoding::encoder<
      prizepool::schema::encoding::scale_encoder_tag>& encoder_;
  prizepool::storage::storage<prizepool::storage::rocksdb_storage_tag>&
      storage_;
  vault_guard_table guards_;
  mutable std::mutex governance_mutex_;
  mutable std::mutex reserve_mutex_;
  mutable std::mutex events_mutex_;
  mutable std::mutex hooks_mutex_;
  uint64_t next_event_id_{1};
  prizepool::schema::hash32_t state_root_{};
  asset_transfer_t asset_transfer_;
  time_source_t time_source_;
  randomness_beacon_t randomness_beacon_;
};

}  // namespace prizepool::execution
