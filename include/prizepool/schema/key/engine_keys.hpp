#pragma once

#include <prizepool/schema/asset_ref.hpp>
#include <prizepool/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Pool workflow: canonical key prefixes and key codecs for vault state,
// depositor rows, the depositor slot table, reserves, events and the
// transfer outbox.
namespace prizepool::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kGovernanceKeyPrefix{
    "SYS|STATE|GOVERNANCE|"};
inline constexpr std::string_view kVaultKeyPrefix{"SYS|STATE|VAULT|"};
inline constexpr std::string_view kDepositorKeyPrefix{"SYS|STATE|DEPOSITOR|"};
inline constexpr std::string_view kSlotKeyPrefix{"SYS|STATE|SLOT|"};
inline constexpr std::string_view kReserveKeyPrefix{"SYS|STATE|RESERVE|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kOutboxSeqKeyPrefix{
    "SYS|STATE|OUTBOX_SEQ|"};
inline constexpr std::string_view kStateRootKeyPrefix{"SYS|APP|STATE_ROOT|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};
inline constexpr std::string_view kOutboxPrefix{"SYS|OUTBOX|"};

template <typename Encoder, typename T>
prizepool::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
prizepool::schema::bytes_t make_prefix_key(Encoder& encoder,
                                           std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
prizepool::schema::bytes_t make_governance_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kGovernanceKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
prizepool::schema::bytes_t make_vault_key(
    Encoder& encoder,
    const prizepool::schema::vault_id_t vault_id) {
  return make_prefixed_key(encoder, kVaultKeyPrefix, vault_id);
}

template <typename Encoder>
prizepool::schema::bytes_t make_depositor_key(
    Encoder& encoder,
    const prizepool::schema::vault_id_t vault_id,
    const prizepool::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kDepositorKeyPrefix,
                           std::tuple{vault_id, account});
}

template <typename Encoder>
prizepool::schema::bytes_t make_slot_key(
    Encoder& encoder,
    const prizepool::schema::vault_id_t vault_id,
    const uint64_t slot) {
  return make_prefixed_key(encoder, kSlotKeyPrefix, std::tuple{vault_id, slot});
}

template <typename Encoder>
prizepool::schema::bytes_t make_reserve_key(
    Encoder& encoder,
    const prizepool::schema::asset_ref_t& asset) {
  return make_prefixed_key(encoder, kReserveKeyPrefix,
                           std::tuple{asset.kind, asset.contract});
}

template <typename Encoder>
prizepool::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
prizepool::schema::bytes_t make_outbox_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kOutboxSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
prizepool::schema::bytes_t make_state_root_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kStateRootKeyPrefix,
                           std::string_view{"LATEST"});
}

template <typename Encoder>
prizepool::schema::bytes_t make_event_key(Encoder& encoder,
                                          const uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

template <typename Encoder>
prizepool::schema::bytes_t make_outbox_key(Encoder& encoder,
                                           const uint64_t sequence) {
  return make_prefixed_key(encoder, kOutboxPrefix, sequence);
}

template <typename Encoder>
std::optional<uint64_t> parse_event_key(
    Encoder& encoder,
    const prizepool::schema::bytes_view_t& key) {
  auto decoded =
      encoder.template try_decode<std::tuple<std::string, uint64_t>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kEventPrefix) {
    return std::nullopt;
  }
  return std::get<1>(decoded.value());
}

}  // namespace prizepool::schema::key
