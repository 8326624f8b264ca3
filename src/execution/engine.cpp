#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <iterator>
#include <limits>
#include <prizepool/blake3/hash.hpp>
#include <prizepool/common/critical.hpp>
#include <prizepool/execution/engine.hpp>
#include <prizepool/execution/settlement.hpp>
#include <prizepool/schema/encoding/scale/encoder.hpp>
#include <prizepool/schema/event_type.hpp>
#include <prizepool/schema/key/engine_keys.hpp>
#include <prizepool/schema/query_error_code.hpp>
#include <string>
#include <tuple>
#include <utility>

using namespace prizepool::schema;

namespace {

constexpr auto kMaxEventRange = uint64_t{1000};

std::string_view describe(const transaction_error_code code) {
  switch (code) {
    case transaction_error_code::invalid_transaction:
      return "invalid transaction";
    case transaction_error_code::unsupported_transaction_version:
      return "unsupported transaction version";
    case transaction_error_code::unauthorized:
      return "signer is not authorized for this operation";
    case transaction_error_code::invalid_parameter:
      return "invalid parameter";
    case transaction_error_code::vault_missing:
      return "vault does not exist";
    case transaction_error_code::vault_inactive:
      return "vault is not active";
    case transaction_error_code::deposit_window_closed:
      return "deposit window closed";
    case transaction_error_code::zero_amount:
      return "amount must be greater than zero";
    case transaction_error_code::unexpected_payment:
      return "token vaults do not accept attached value";
    case transaction_error_code::transfer_failed:
      return "asset transfer failed";
    case transaction_error_code::no_deposit:
      return "no deposit found";
    case transaction_error_code::no_depositors:
      return "vault has no depositors";
    case transaction_error_code::insufficient_pool_funds:
      return "insufficient pool funds";
    case transaction_error_code::not_yet_settled:
      return "winner not selected yet";
    case transaction_error_code::not_matured:
      return "vault has not matured";
    case transaction_error_code::winner_already_selected:
      return "winner already selected";
    case transaction_error_code::reentrant_call:
      return "re-entrant call";
  }
  return "unknown error";
}

transaction_result_t& reject(transaction_result_t& result,
                             const transaction_error_code code,
                             const std::string_view codespace) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{describe(code)};
  result.codespace = std::string{codespace};
  spdlog::warn("{} rejected: {}", codespace, result.log);
  return result;
}

query_result_t& reject(query_result_t& result,
                       const query_error_code code,
                       const std::string_view log) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.codespace = "prizepool.query";
  return result;
}

std::string account_string(const account_id_t& account) {
  return to_hex(bytes_view_t{account.data(), account.size()});
}

std::string asset_string(const asset_ref_t& asset) {
  auto out = std::string{to_string(asset.kind)};
  if (!is_native(asset)) {
    out += ":" + to_hex(bytes_view_t{asset.contract.data(),
                                     asset.contract.size()});
  }
  return out;
}

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             const bool index = false) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

transaction_event_t make_event(
    const event_type_t type,
    std::vector<transaction_event_attribute_t> attributes) {
  return transaction_event_t{.type = type,
                             .attributes = std::move(attributes)};
}

transaction_event_t make_withdrawn_event(const vault_id_t vault_id,
                                         const account_id_t& account,
                                         const amount_t& amount,
                                         const std::string_view reason) {
  return make_event(
      event_type_t::withdrawn,
      {make_attribute("vault_id", std::to_string(vault_id), true),
       make_attribute("account", account_string(account), true),
       make_attribute("amount", to_string(amount)),
       make_attribute("reason", std::string{reason})});
}

}  // namespace

namespace prizepool::execution {

engine::engine(
    prizepool::schema::encoding::encoder<
        prizepool::schema::encoding::scale_encoder_tag>& encoder,
    prizepool::storage::storage<prizepool::storage::rocksdb_storage_tag>&
        storage,
    const engine_options& options)
    : encoder_{encoder}, storage_{storage} {
  spdlog::info("Initializing prize pool engine");
  load_persisted_state(options);
  spdlog::info("Prize pool engine ready; next event id {}", next_event_id_);
}

transaction_result_t engine::execute(const bytes_view_t& raw_tx) {
  auto result = transaction_result_t{};
  if (raw_tx.empty()) {
    return reject(result, transaction_error_code::invalid_transaction,
                  "prizepool.execute");
  }
  auto version = encoder_.try_decode<uint16_t>(raw_tx);
  if (!version.has_value()) {
    return reject(result, transaction_error_code::invalid_transaction,
                  "prizepool.execute");
  }
  if (*version != 1) {
    reject(result, transaction_error_code::unsupported_transaction_version,
           "prizepool.execute");
    result.info = "expected version 1";
    return result;
  }
  auto tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!tx.has_value()) {
    return reject(result, transaction_error_code::invalid_transaction,
                  "prizepool.execute");
  }
  return execute(*tx);
}

transaction_result_t engine::execute(const transaction_t& tx) {
  if (tx.version != 1) {
    auto result = transaction_result_t{};
    reject(result, transaction_error_code::unsupported_transaction_version,
           "prizepool.execute");
    result.info = "expected version 1";
    return result;
  }
  return std::visit(
      overloaded{[&](const create_vault_t& payload) {
                   return create_vault(tx.signer, payload);
                 },
                 [&](const deposit_t& payload) {
                   return deposit(tx.signer, tx.attached_value, payload);
                 },
                 [&](const withdraw_t& payload) {
                   return withdraw(tx.signer, payload);
                 },
                 [&](const delete_vault_t& payload) {
                   return delete_vault(tx.signer, payload);
                 },
                 [&](const select_winner_t& payload) {
                   return select_winner(tx.signer, payload);
                 },
                 [&](const fund_reserve_t& payload) {
                   return fund_reserve(tx.signer, tx.attached_value, payload);
                 },
                 [&](const set_admin_t& payload) {
                   return set_admin(tx.signer, payload);
                 }},
      tx.payload);
}

transaction_result_t engine::create_vault(const account_id_t& signer,
                                          const create_vault_t& payload) {
  static constexpr auto kCodespace = std::string_view{"prizepool.create_vault"};
  auto result = transaction_result_t{};
  if (payload.interest_rate_bps == 0) {
    return reject(result, transaction_error_code::invalid_parameter,
                  kCodespace);
  }
  if (!is_native(payload.asset) && payload.asset.contract == make_zero_hash()) {
    return reject(result, transaction_error_code::invalid_parameter,
                  kCodespace);
  }
  auto created_at = now();
  // Maturity is created_at + duration and must not wrap.
  if (payload.duration >
      std::numeric_limits<timestamp_seconds_t>::max() - created_at) {
    return reject(result, transaction_error_code::invalid_parameter,
                  kCodespace);
  }

  auto vault = vault_state_t{};
  {
    auto lock = std::scoped_lock{governance_mutex_};
    auto governance = load_governance();
    if (!governance.has_value()) {
      prizepool::common::critical("governance record missing");
    }
    if (signer != governance->admin) {
      return reject(result, transaction_error_code::unauthorized, kCodespace);
    }
    vault = vault_state_t{.vault_id = governance->next_vault_id,
                          .name = payload.name,
                          .asset = payload.asset,
                          .created_at = created_at,
                          .duration = payload.duration,
                          .interest_rate_bps = payload.interest_rate_bps,
                          .active = true};
    ++governance->next_vault_id;
    storage_.commit(prizepool::storage::write_batch_t{
        {.key = key::make_vault_key(encoder_, vault.vault_id),
         .value = encoder_.encode(vault)},
        {.key = key::make_governance_key(encoder_),
         .value = encoder_.encode(*governance)}});
  }

  spdlog::info("Created vault {} '{}' ({}, {} bps, {}s)", vault.vault_id,
               make_string_view(vault.name), asset_string(vault.asset),
               vault.interest_rate_bps, vault.duration);
  result.data = encoder_.encode(vault.vault_id);
  record(result,
         {make_event(
             event_type_t::vault_created,
             {make_attribute("vault_id", std::to_string(vault.vault_id), true),
              make_attribute("name", make_string(vault.name)),
              make_attribute("asset", asset_string(vault.asset)),
              make_attribute("created_at", std::to_string(vault.created_at)),
              make_attribute("duration", std::to_string(vault.duration)),
              make_attribute("interest_rate_bps",
                             std::to_string(vault.interest_rate_bps))})});
  return result;
}

transaction_result_t engine::deposit(const account_id_t& signer,
                                     const amount_t& attached_value,
                                     const deposit_t& payload) {
  static constexpr auto kCodespace = std::string_view{"prizepool.deposit"};
  auto result = transaction_result_t{};
  auto guard = guards_.acquire(payload.vault_id);
  if (!guard.has_value()) {
    return reject(result, transaction_error_code::reentrant_call, kCodespace);
  }

  auto staged = staged_writes{encoder_, storage_};
  auto vault_key = key::make_vault_key(encoder_, payload.vault_id);
  auto vault = staged.get<vault_state_t>(vault_key);
  if (!vault.has_value()) {
    return reject(result, transaction_error_code::vault_missing, kCodespace);
  }
  if (!vault->active) {
    return reject(result, transaction_error_code::vault_inactive, kCodespace);
  }
  if (vault->matured(now())) {
    return reject(result, transaction_error_code::deposit_window_closed,
                  kCodespace);
  }

  auto amount = amount_t{0};
  if (auto error = collect(signer, vault->asset, attached_value,
                           payload.amount, vault->vault_id, amount)) {
    return reject(result, *error, kCodespace);
  }

  auto depositor_key =
      key::make_depositor_key(encoder_, vault->vault_id, signer);
  auto entry =
      staged.get<depositor_state_t>(depositor_key).value_or(depositor_state_t{});
  if (entry.principal == 0) {
    entry.slot = vault->depositor_count;
    staged.put(key::make_slot_key(encoder_, vault->vault_id, entry.slot),
               signer);
    ++vault->depositor_count;
  }
  entry.principal += amount;
  vault->total_principal += amount;
  staged.put(depositor_key, entry);
  staged.put(vault_key, *vault);
  commit(staged, vault->asset, reserve_change::credit, amount);

  spdlog::debug("Vault {} deposit of {} by {}", vault->vault_id,
                to_string(amount), account_string(signer));
  record(result,
         {make_event(
             event_type_t::deposited,
             {make_attribute("vault_id", std::to_string(vault->vault_id), true),
              make_attribute("account", account_string(signer), true),
              make_attribute("amount", to_string(amount)),
              make_attribute("principal", to_string(entry.principal))})});
  return result;
}

transaction_result_t engine::withdraw(const account_id_t& signer,
                                      const withdraw_t& payload) {
  static constexpr auto kCodespace = std::string_view{"prizepool.withdraw"};
  auto result = transaction_result_t{};
  auto guard = guards_.acquire(payload.vault_id);
  if (!guard.has_value()) {
    return reject(result, transaction_error_code::reentrant_call, kCodespace);
  }

  auto staged = staged_writes{encoder_, storage_};
  auto vault_key = key::make_vault_key(encoder_, payload.vault_id);
  auto vault = staged.get<vault_state_t>(vault_key);
  if (!vault.has_value()) {
    return reject(result, transaction_error_code::vault_missing, kCodespace);
  }
  if (!vault->active) {
    return reject(result, transaction_error_code::vault_inactive, kCodespace);
  }
  auto depositor_key =
      key::make_depositor_key(encoder_, vault->vault_id, signer);
  auto entry = staged.get<depositor_state_t>(depositor_key);
  if (!entry.has_value() || entry->principal == 0) {
    return reject(result, transaction_error_code::no_deposit, kCodespace);
  }

  auto events = std::vector<transaction_event_t>{};
  auto current_time = now();
  auto drawn_from = uint64_t{0};
  if (vault->matured(current_time) && !vault->winner_selected) {
    drawn_from = vault->depositor_count;
    settle(staged, *vault, current_time, events);
    entry = staged.get<depositor_state_t>(depositor_key);
  }

  auto amount = entry->claimable != 0 ? entry->claimable : entry->principal;
  remove_depositor(staged, *vault, signer, *entry);
  vault->total_principal -= entry->principal;
  staged.put(vault_key, *vault);

  if (commit(staged, vault->asset, reserve_change::debit, amount) ==
      commit_status::insufficient_reserve) {
    return reject(result, transaction_error_code::insufficient_pool_funds,
                  kCodespace);
  }
  if (!transfer(transfer_request_t{.direction = transfer_direction_t::push,
                                   .asset = vault->asset,
                                   .account = signer,
                                   .amount = amount,
                                   .vault_id = vault->vault_id})) {
    revert(staged, vault->asset, amount);
    return reject(result, transaction_error_code::transfer_failed, kCodespace);
  }

  if (drawn_from > 0) {
    log_settlement(*vault, drawn_from);
  }
  spdlog::info("Vault {} paid {} to {}", vault->vault_id, to_string(amount),
               account_string(signer));
  result.data = encoder_.encode(amount);
  events.push_back(
      make_withdrawn_event(vault->vault_id, signer, amount, "withdraw"));
  record(result, std::move(events));
  return result;
}

transaction_result_t engine::delete_vault(const account_id_t& signer,
                                          const delete_vault_t& payload) {
  static constexpr auto kCodespace = std::string_view{"prizepool.delete_vault"};
  auto result = transaction_result_t{};
  if (!is_admin(signer)) {
    return reject(result, transaction_error_code::unauthorized, kCodespace);
  }
  auto guard = guards_.acquire(payload.vault_id);
  if (!guard.has_value()) {
    return reject(result, transaction_error_code::reentrant_call, kCodespace);
  }

  auto vault_key = key::make_vault_key(encoder_, payload.vault_id);
  auto vault = storage_.get<vault_state_t>(
      encoder_, make_bytes_view(vault_key));
  if (!vault.has_value()) {
    return reject(result, transaction_error_code::vault_missing, kCodespace);
  }
  if (!vault->active) {
    return reject(result, transaction_error_code::vault_inactive, kCodespace);
  }

  auto matured = vault->matured(now());
  auto events = std::vector<transaction_event_t>{};
  while (vault->depositor_count > 0) {
    auto step = staged_writes{encoder_, storage_};
    auto slot = vault->depositor_count - 1;
    auto account = step.get<account_id_t>(
        key::make_slot_key(encoder_, vault->vault_id, slot));
    if (!account.has_value()) {
      prizepool::common::critical("depositor slot table is inconsistent");
    }
    auto entry = step.get<depositor_state_t>(
        key::make_depositor_key(encoder_, vault->vault_id, *account));
    if (!entry.has_value()) {
      prizepool::common::critical("depositor record is missing");
    }
    auto payout = entry->principal;
    if (matured) {
      payout += compute_interest(entry->principal, vault->interest_rate_bps,
                                 vault->duration);
    }

    auto before = *vault;
    remove_depositor(step, *vault, *account, *entry);
    vault->total_principal -= entry->principal;
    step.put(vault_key, *vault);

    if (commit(step, vault->asset, reserve_change::debit, payout) ==
        commit_status::insufficient_reserve) {
      spdlog::warn("Vault {} deletion stopped with {} depositor(s) unpaid",
                   vault->vault_id, before.depositor_count);
      record(result, std::move(events));
      return reject(result, transaction_error_code::insufficient_pool_funds,
                    kCodespace);
    }
    if (!transfer(transfer_request_t{.direction = transfer_direction_t::push,
                                     .asset = vault->asset,
                                     .account = *account,
                                     .amount = payout,
                                     .vault_id = vault->vault_id})) {
      revert(step, vault->asset, payout);
      spdlog::warn("Vault {} deletion stopped with {} depositor(s) unpaid",
                   vault->vault_id, before.depositor_count);
      record(result, std::move(events));
      return reject(result, transaction_error_code::transfer_failed,
                    kCodespace);
    }
    events.push_back(make_withdrawn_event(vault->vault_id, *account, payout,
                                          "force_delete"));
  }

  vault->active = false;
  storage_.put(encoder_, make_bytes_view(vault_key), *vault);
  spdlog::info("Deleted vault {}", vault->vault_id);
  events.push_back(make_event(
      event_type_t::vault_deleted,
      {make_attribute("vault_id", std::to_string(vault->vault_id), true)}));
  record(result, std::move(events));
  return result;
}

transaction_result_t engine::select_winner(const account_id_t& signer,
                                           const select_winner_t& payload) {
  static constexpr auto kCodespace =
      std::string_view{"prizepool.select_winner"};
  auto result = transaction_result_t{};
  auto guard = guards_.acquire(payload.vault_id);
  if (!guard.has_value()) {
    return reject(result, transaction_error_code::reentrant_call, kCodespace);
  }

  auto staged = staged_writes{encoder_, storage_};
  auto vault = staged.get<vault_state_t>(
      key::make_vault_key(encoder_, payload.vault_id));
  if (!vault.has_value()) {
    return reject(result, transaction_error_code::vault_missing, kCodespace);
  }
  if (!vault->active) {
    return reject(result, transaction_error_code::vault_inactive, kCodespace);
  }
  auto current_time = now();
  if (!vault->matured(current_time)) {
    return reject(result, transaction_error_code::not_matured, kCodespace);
  }
  if (vault->winner_selected) {
    return reject(result, transaction_error_code::winner_already_selected,
                  kCodespace);
  }
  if (vault->depositor_count == 0) {
    return reject(result, transaction_error_code::no_depositors, kCodespace);
  }

  auto events = std::vector<transaction_event_t>{};
  settle(staged, *vault, current_time, events);
  storage_.commit(staged.batch());
  log_settlement(*vault, vault->depositor_count);
  spdlog::debug("Draw for vault {} requested by {}", vault->vault_id,
                account_string(signer));
  record(result, std::move(events));
  return result;
}

transaction_result_t engine::fund_reserve(const account_id_t& signer,
                                          const amount_t& attached_value,
                                          const fund_reserve_t& payload) {
  static constexpr auto kCodespace = std::string_view{"prizepool.fund_reserve"};
  auto result = transaction_result_t{};
  if (!is_admin(signer)) {
    return reject(result, transaction_error_code::unauthorized, kCodespace);
  }
  if (!is_native(payload.asset) && payload.asset.contract == make_zero_hash()) {
    return reject(result, transaction_error_code::invalid_parameter,
                  kCodespace);
  }

  auto amount = amount_t{0};
  if (auto error = collect(signer, payload.asset, attached_value,
                           payload.amount, 0, amount)) {
    return reject(result, *error, kCodespace);
  }
  auto staged = staged_writes{encoder_, storage_};
  commit(staged, payload.asset, reserve_change::credit, amount);

  auto total = reserve(payload.asset);
  spdlog::info("Reserve for {} funded with {}", asset_string(payload.asset),
               to_string(amount));
  record(result, {make_event(event_type_t::reserve_funded,
                             {make_attribute("asset",
                                             asset_string(payload.asset), true),
                              make_attribute("amount", to_string(amount)),
                              make_attribute("reserve", to_string(total))})});
  return result;
}

transaction_result_t engine::set_admin(const account_id_t& signer,
                                       const set_admin_t& payload) {
  static constexpr auto kCodespace = std::string_view{"prizepool.set_admin"};
  auto result = transaction_result_t{};
  auto previous = account_id_t{};
  {
    auto lock = std::scoped_lock{governance_mutex_};
    auto governance = load_governance();
    if (!governance.has_value()) {
      prizepool::common::critical("governance record missing");
    }
    if (signer != governance->owner) {
      return reject(result, transaction_error_code::unauthorized, kCodespace);
    }
    previous = governance->admin;
    governance->admin = payload.admin;
    storage_.put(encoder_,
                 make_bytes_view(key::make_governance_key(encoder_)),
                 *governance);
  }

  spdlog::info("Administrator changed from {} to {}", account_string(previous),
               account_string(payload.admin));
  record(result, {make_event(
                     event_type_t::admin_changed,
                     {make_attribute("previous", account_string(previous)),
                      make_attribute("admin", account_string(payload.admin),
                                     true)})});
  return result;
}

std::optional<vault_summary_t> engine::vault_summary(
    const vault_id_t vault_id) const {
  auto vault = storage_.get<vault_state_t>(
      encoder_, make_bytes_view(key::make_vault_key(encoder_, vault_id)));
  if (!vault.has_value()) {
    return std::nullopt;
  }
  auto current_time = now();
  auto maturity = vault->maturity();
  return vault_summary_t{
      .vault_id = vault->vault_id,
      .name = vault->name,
      .asset = vault->asset,
      .interest_rate_bps = vault->interest_rate_bps,
      .created_at = vault->created_at,
      .duration = vault->duration,
      .time_left = current_time >= maturity ? 0 : maturity - current_time,
      .total_principal = vault->total_principal,
      .depositor_count = vault->depositor_count,
      .active = vault->active,
      .winner_selected = vault->winner_selected};
}

std::optional<depositor_balance_t> engine::depositor_balance(
    const vault_id_t vault_id,
    const account_id_t& account) const {
  auto vault = storage_.get<vault_state_t>(
      encoder_, make_bytes_view(key::make_vault_key(encoder_, vault_id)));
  if (!vault.has_value()) {
    return std::nullopt;
  }
  auto entry = storage_.get<depositor_state_t>(
      encoder_,
      make_bytes_view(key::make_depositor_key(encoder_, vault_id, account)));
  if (!entry.has_value()) {
    return depositor_balance_t{};
  }
  auto balance = depositor_balance_t{.principal = entry->principal,
                                     .claimable = entry->claimable};
  if (vault->matured(now())) {
    balance.accrued_interest = compute_interest(
        entry->principal, vault->interest_rate_bps, vault->duration);
  }
  return balance;
}

std::optional<std::vector<account_id_t>> engine::list_depositors(
    const vault_id_t vault_id) const {
  auto vault = storage_.get<vault_state_t>(
      encoder_, make_bytes_view(key::make_vault_key(encoder_, vault_id)));
  if (!vault.has_value()) {
    return std::nullopt;
  }
  auto accounts = std::vector<account_id_t>{};
  accounts.reserve(vault->depositor_count);
  for (auto slot = uint64_t{0}; slot < vault->depositor_count; ++slot) {
    auto account = storage_.get<account_id_t>(
        encoder_, make_bytes_view(key::make_slot_key(encoder_, vault_id, slot)));
    if (!account.has_value()) {
      prizepool::common::critical("depositor slot table is inconsistent");
    }
    accounts.push_back(*account);
  }
  return accounts;
}

bool engine::is_depositor(const vault_id_t vault_id,
                          const account_id_t& account) const {
  auto entry = storage_.get<depositor_state_t>(
      encoder_,
      make_bytes_view(key::make_depositor_key(encoder_, vault_id, account)));
  return entry.has_value() && entry->principal > 0;
}

std::optional<winner_info_t> engine::winner(const vault_id_t vault_id) const {
  auto vault = storage_.get<vault_state_t>(
      encoder_, make_bytes_view(key::make_vault_key(encoder_, vault_id)));
  if (!vault.has_value() || !vault->winner_selected ||
      !vault->winner.has_value()) {
    return std::nullopt;
  }
  return winner_info_t{.winner = *vault->winner,
                       .total_interest = vault->total_interest};
}

bool engine::has_winner(const vault_id_t vault_id) const {
  auto vault = storage_.get<vault_state_t>(
      encoder_, make_bytes_view(key::make_vault_key(encoder_, vault_id)));
  return vault.has_value() && vault->winner_selected;
}

amount_t engine::reserve(const asset_ref_t& asset) const {
  auto lock = std::scoped_lock{reserve_mutex_};
  return storage_
      .get<amount_t>(encoder_,
                     make_bytes_view(key::make_reserve_key(encoder_, asset)))
      .value_or(amount_t{0});
}

governance_state_t engine::governance() const {
  auto lock = std::scoped_lock{governance_mutex_};
  auto governance = load_governance();
  if (!governance.has_value()) {
    prizepool::common::critical("governance record missing");
  }
  return *governance;
}

std::vector<event_record_t> engine::events(const uint64_t from_id,
                                           const uint64_t to_id) const {
  auto out = std::vector<event_record_t>{};
  auto last = uint64_t{};
  {
    auto lock = std::scoped_lock{events_mutex_};
    last = next_event_id_ - 1;
  }
  auto first = std::max<uint64_t>(from_id, 1);
  auto end = std::min(to_id, last);
  if (first > end) {
    return out;
  }
  end = std::min(end, first + kMaxEventRange - 1);
  out.reserve(end - first + 1);
  for (auto id = first; id <= end; ++id) {
    auto record = storage_.get<event_record_t>(
        encoder_, make_bytes_view(key::make_event_key(encoder_, id)));
    if (record.has_value()) {
      out.push_back(std::move(*record));
    }
  }
  return out;
}

hash32_t engine::state_root() const {
  auto lock = std::scoped_lock{events_mutex_};
  return state_root_;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.codespace = "prizepool.query";

  if (path == "/engine/info") {
    auto last_event_id = uint64_t{};
    auto root = hash32_t{};
    {
      auto lock = std::scoped_lock{events_mutex_};
      last_event_id = next_event_id_ - 1;
      root = state_root_;
    }
    result.value = encoder_.encode(root);
    encoder_.encode(governance(), result.value);
    encoder_.encode(last_event_id, result.value);
    return result;
  }
  if (path == "/state/vault") {
    auto vault_id = encoder_.try_decode<vault_id_t>(data);
    if (!vault_id.has_value()) {
      return reject(result, query_error_code::invalid_key,
                    "expected SCALE vault id");
    }
    auto summary = vault_summary(*vault_id);
    if (!summary.has_value()) {
      return reject(result, query_error_code::not_found, "vault not found");
    }
    result.value = encoder_.encode(*summary);
    return result;
  }
  if (path == "/state/depositor" || path == "/state/is_depositor") {
    auto decoded =
        encoder_.try_decode<std::tuple<vault_id_t, account_id_t>>(data);
    if (!decoded.has_value()) {
      return reject(result, query_error_code::invalid_key,
                    "expected SCALE tuple(vault id, account)");
    }
    const auto& [vault_id, account] = *decoded;
    auto balance = depositor_balance(vault_id, account);
    if (!balance.has_value()) {
      return reject(result, query_error_code::not_found, "vault not found");
    }
    if (path == "/state/is_depositor") {
      result.value = encoder_.encode(balance->principal > 0);
    } else {
      result.value = encoder_.encode(*balance);
    }
    return result;
  }
  if (path == "/state/depositors") {
    auto vault_id = encoder_.try_decode<vault_id_t>(data);
    if (!vault_id.has_value()) {
      return reject(result, query_error_code::invalid_key,
                    "expected SCALE vault id");
    }
    auto accounts = list_depositors(*vault_id);
    if (!accounts.has_value()) {
      return reject(result, query_error_code::not_found, "vault not found");
    }
    result.value = encoder_.encode(*accounts);
    return result;
  }
  if (path == "/state/winner" || path == "/state/has_winner") {
    auto vault_id = encoder_.try_decode<vault_id_t>(data);
    if (!vault_id.has_value()) {
      return reject(result, query_error_code::invalid_key,
                    "expected SCALE vault id");
    }
    auto vault = storage_.get<vault_state_t>(
        encoder_, make_bytes_view(key::make_vault_key(encoder_, *vault_id)));
    if (!vault.has_value()) {
      return reject(result, query_error_code::not_found, "vault not found");
    }
    if (path == "/state/has_winner") {
      result.value = encoder_.encode(vault->winner_selected);
      return result;
    }
    auto info = winner(*vault_id);
    if (!info.has_value()) {
      return reject(result, query_error_code::not_yet_settled,
                    "winner not selected yet");
    }
    result.value = encoder_.encode(*info);
    return result;
  }
  if (path == "/state/reserve") {
    auto asset = encoder_.try_decode<asset_ref_t>(data);
    if (!asset.has_value()) {
      return reject(result, query_error_code::invalid_key,
                    "expected SCALE asset reference");
    }
    result.value = encoder_.encode(reserve(*asset));
    return result;
  }
  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range.has_value()) {
      return reject(result, query_error_code::invalid_key,
                    "expected SCALE tuple(from id, to id)");
    }
    result.value = encoder_.encode(
        events(std::get<0>(range.value()), std::get<1>(range.value())));
    return result;
  }
  return reject(result, query_error_code::unsupported_path,
                "unsupported query path");
}

void engine::set_asset_transfer(asset_transfer_t transfer) {
  auto lock = std::scoped_lock{hooks_mutex_};
  asset_transfer_ = std::move(transfer);
}

void engine::set_time_source(time_source_t time_source) {
  auto lock = std::scoped_lock{hooks_mutex_};
  time_source_ = std::move(time_source);
}

void engine::set_randomness_beacon(randomness_beacon_t beacon) {
  auto lock = std::scoped_lock{hooks_mutex_};
  randomness_beacon_ = std::move(beacon);
}

timestamp_seconds_t engine::now() const {
  auto source = time_source_t{};
  {
    auto lock = std::scoped_lock{hooks_mutex_};
    source = time_source_;
  }
  if (source) {
    return source();
  }
  return static_cast<timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

hash32_t engine::sample_beacon() const {
  auto beacon = randomness_beacon_t{};
  {
    auto lock = std::scoped_lock{hooks_mutex_};
    beacon = randomness_beacon_;
  }
  if (beacon) {
    return beacon();
  }
  return state_root();
}

bool engine::transfer(const transfer_request_t& request) const {
  auto hook = asset_transfer_t{};
  {
    auto lock = std::scoped_lock{hooks_mutex_};
    hook = asset_transfer_;
  }
  if (!hook) {
    spdlog::warn("No asset transfer hook installed; refusing {} of {}",
                 to_string(request.direction), to_string(request.amount));
    return false;
  }
  try {
    return hook(request);
  } catch (const std::exception& ex) {
    spdlog::error("Asset transfer hook failed: {}", ex.what());
    return false;
  }
}

std::optional<governance_state_t> engine::load_governance() const {
  return storage_.get<governance_state_t>(
      encoder_, make_bytes_view(key::make_governance_key(encoder_)));
}

bool engine::is_admin(const account_id_t& account) const {
  return governance().admin == account;
}

std::optional<transaction_error_code> engine::collect(
    const account_id_t& signer,
    const asset_ref_t& asset,
    const amount_t& attached_value,
    const amount_t& requested,
    const vault_id_t vault_id,
    amount_t& amount) {
  if (is_native(asset)) {
    if (requested != 0 && requested != attached_value) {
      return transaction_error_code::invalid_parameter;
    }
    if (attached_value == 0) {
      return transaction_error_code::zero_amount;
    }
    amount = attached_value;
    return std::nullopt;
  }
  if (attached_value != 0) {
    return transaction_error_code::unexpected_payment;
  }
  if (requested == 0) {
    return transaction_error_code::zero_amount;
  }
  if (!transfer(transfer_request_t{.direction = transfer_direction_t::pull,
                                   .asset = asset,
                                   .account = signer,
                                   .amount = requested,
                                   .vault_id = vault_id})) {
    return transaction_error_code::transfer_failed;
  }
  amount = requested;
  return std::nullopt;
}

void engine::settle(staged_writes& staged,
                    vault_state_t& vault,
                    const timestamp_seconds_t current_time,
                    std::vector<transaction_event_t>& events) {
  auto entries = std::vector<std::pair<account_id_t, depositor_state_t>>{};
  entries.reserve(vault.depositor_count);
  auto pot = amount_t{0};
  for (auto slot = uint64_t{0}; slot < vault.depositor_count; ++slot) {
    auto account = staged.get<account_id_t>(
        key::make_slot_key(encoder_, vault.vault_id, slot));
    if (!account.has_value()) {
      prizepool::common::critical("depositor slot table is inconsistent");
    }
    auto entry = staged.get<depositor_state_t>(
        key::make_depositor_key(encoder_, vault.vault_id, *account));
    if (!entry.has_value()) {
      prizepool::common::critical("depositor record is missing");
    }
    pot += compute_interest(entry->principal, vault.interest_rate_bps,
                            vault.duration);
    entries.emplace_back(*account, *entry);
  }

  auto seed = derive_seed(sample_beacon(), vault.vault_id, current_time);
  auto index = select_index(seed, entries.size());
  for (auto i = size_t{0}; i < entries.size(); ++i) {
    auto& [account, entry] = entries[i];
    entry.claimable = entry.principal;
    if (i == index) {
      entry.claimable += pot;
    }
    staged.put(key::make_depositor_key(encoder_, vault.vault_id, account),
               entry);
  }

  const auto& winner = entries[index].first;
  vault.winner_selected = true;
  vault.winner = winner;
  vault.total_interest = pot;
  staged.put(key::make_vault_key(encoder_, vault.vault_id), vault);

  events.push_back(make_event(
      event_type_t::winner_selected,
      {make_attribute("vault_id", std::to_string(vault.vault_id), true),
       make_attribute("winner", account_string(winner), true),
       make_attribute("total_interest", to_string(pot)),
       make_attribute("depositor_count", std::to_string(entries.size()))}));
}

void engine::log_settlement(const vault_state_t& vault,
                            const uint64_t depositors) const {
  spdlog::info("Vault {} winner {} takes {} across {} depositor(s)",
               vault.vault_id,
               account_string(vault.winner.value_or(account_id_t{})),
               to_string(vault.total_interest), depositors);
}

void engine::remove_depositor(staged_writes& staged,
                              vault_state_t& vault,
                              const account_id_t& account,
                              const depositor_state_t& entry) {
  auto last = vault.depositor_count - 1;
  if (entry.slot != last) {
    auto moved = staged.get<account_id_t>(
        key::make_slot_key(encoder_, vault.vault_id, last));
    if (!moved.has_value()) {
      prizepool::common::critical("depositor slot table is inconsistent");
    }
    auto moved_key = key::make_depositor_key(encoder_, vault.vault_id, *moved);
    auto moved_entry = staged.get<depositor_state_t>(moved_key);
    if (!moved_entry.has_value()) {
      prizepool::common::critical("depositor record is missing");
    }
    moved_entry->slot = entry.slot;
    staged.put(moved_key, *moved_entry);
    staged.put(key::make_slot_key(encoder_, vault.vault_id, entry.slot),
               *moved);
  }
  staged.erase(key::make_slot_key(encoder_, vault.vault_id, last));
  staged.erase(key::make_depositor_key(encoder_, vault.vault_id, account));
  vault.depositor_count = last;
}

engine::commit_status engine::commit(const staged_writes& staged,
                                     const asset_ref_t& asset,
                                     const reserve_change change,
                                     const amount_t& amount) {
  auto lock = std::scoped_lock{reserve_mutex_};
  auto reserve_key = key::make_reserve_key(encoder_, asset);
  auto current = storage_.get<amount_t>(encoder_, make_bytes_view(reserve_key))
                     .value_or(amount_t{0});
  if (change == reserve_change::debit && current < amount) {
    spdlog::warn("Reserve for {} holds {}, needs {}", asset_string(asset),
                 to_string(current), to_string(amount));
    return commit_status::insufficient_reserve;
  }
  auto updated =
      change == reserve_change::credit ? current + amount : current - amount;
  auto batch = staged.batch();
  batch.push_back(prizepool::storage::write_entry{
      .key = reserve_key, .value = encoder_.encode(updated)});
  storage_.commit(batch);
  return commit_status::committed;
}

void engine::revert(const staged_writes& staged,
                    const asset_ref_t& asset,
                    const amount_t& debited) {
  auto lock = std::scoped_lock{reserve_mutex_};
  auto reserve_key = key::make_reserve_key(encoder_, asset);
  auto current = storage_.get<amount_t>(encoder_, make_bytes_view(reserve_key))
                     .value_or(amount_t{0});
  auto batch = staged.undo_batch();
  batch.push_back(prizepool::storage::write_entry{
      .key = reserve_key, .value = encoder_.encode(amount_t{current + debited})});
  storage_.commit(batch);
  spdlog::debug("Reverted {} staged write(s) after refused transfer",
                batch.size() - 1);
}

void engine::record(transaction_result_t& result,
                    std::vector<transaction_event_t> events) {
  if (events.empty()) {
    return;
  }
  auto recorded_at = now();
  auto lock = std::scoped_lock{events_mutex_};
  auto batch = prizepool::storage::write_batch_t{};
  batch.reserve(events.size() + 2);
  auto chain = prizepool::blake3::hasher{};
  chain.update(state_root_);
  for (const auto& event : events) {
    auto entry = event_record_t{
        .event_id = next_event_id_, .recorded_at = recorded_at, .event = event};
    auto encoded = encoder_.encode(entry);
    chain.update(bytes_view_t{encoded.data(), encoded.size()});
    batch.push_back(prizepool::storage::write_entry{
        .key = key::make_event_key(encoder_, next_event_id_),
        .value = std::move(encoded)});
    ++next_event_id_;
  }
  state_root_ = chain.finalize();
  batch.push_back(prizepool::storage::write_entry{
      .key = key::make_event_sequence_key(encoder_),
      .value = encoder_.encode(next_event_id_)});
  batch.push_back(prizepool::storage::write_entry{
      .key = key::make_state_root_key(encoder_),
      .value = encoder_.encode(state_root_)});
  storage_.commit(batch);
  result.events.insert(std::end(result.events),
                       std::make_move_iterator(std::begin(events)),
                       std::make_move_iterator(std::end(events)));
}

void engine::load_persisted_state(const engine_options& options) {
  spdlog::debug("Loading persisted engine state");
  {
    auto lock = std::scoped_lock{governance_mutex_};
    if (!load_governance().has_value()) {
      if (options.genesis_owner == make_zero_hash()) {
        spdlog::warn("Genesis owner is the zero account");
      }
      auto genesis = governance_state_t{.owner = options.genesis_owner,
                                        .admin = options.genesis_owner};
      storage_.put(encoder_,
                   make_bytes_view(key::make_governance_key(encoder_)),
                   genesis);
      spdlog::info("Recorded genesis owner {}",
                   account_string(options.genesis_owner));
    }
  }

  auto lock = std::scoped_lock{events_mutex_};
  next_event_id_ =
      storage_
          .get<uint64_t>(encoder_,
                         make_bytes_view(key::make_event_sequence_key(encoder_)))
          .value_or(1);
  state_root_ =
      storage_
          .get<hash32_t>(encoder_,
                         make_bytes_view(key::make_state_root_key(encoder_)))
          .value_or(make_zero_hash());
}

}  // namespace prizepool::execution
