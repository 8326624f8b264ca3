#pragma once
#include <prizepool/common/critical.hpp>
#include <prizepool/schema/encoding/encoder.hpp>
#include <prizepool/schema/encoding/scale/asset_kind.hpp>
#include <prizepool/schema/encoding/scale/asset_ref.hpp>
#include <prizepool/schema/encoding/scale/create_vault.hpp>
#include <prizepool/schema/encoding/scale/delete_vault.hpp>
#include <prizepool/schema/encoding/scale/deposit.hpp>
#include <prizepool/schema/encoding/scale/depositor_balance.hpp>
#include <prizepool/schema/encoding/scale/depositor_state.hpp>
#include <prizepool/schema/encoding/scale/event_record.hpp>
#include <prizepool/schema/encoding/scale/event_type.hpp>
#include <prizepool/schema/encoding/scale/fund_reserve.hpp>
#include <prizepool/schema/encoding/scale/governance_state.hpp>
#include <prizepool/schema/encoding/scale/query_result.hpp>
#include <prizepool/schema/encoding/scale/select_winner.hpp>
#include <prizepool/schema/encoding/scale/set_admin.hpp>
#include <prizepool/schema/encoding/scale/transaction.hpp>
#include <prizepool/schema/encoding/scale/transaction_event.hpp>
#include <prizepool/schema/encoding/scale/transaction_event_attribute.hpp>
#include <prizepool/schema/encoding/scale/transaction_result.hpp>
#include <prizepool/schema/encoding/scale/transfer_direction.hpp>
#include <prizepool/schema/encoding/scale/transfer_request.hpp>
#include <prizepool/schema/encoding/scale/vault_state.hpp>
#include <prizepool/schema/encoding/scale/vault_summary.hpp>
#include <prizepool/schema/encoding/scale/winner_info.hpp>
#include <prizepool/schema/encoding/scale/withdraw.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace prizepool::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  prizepool::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, prizepool::schema::bytes_t& out);

  template <typename T>
  T decode(const prizepool::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const prizepool::schema::bytes_view_t& bytes);
};

template <typename T>
prizepool::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    prizepool::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        prizepool::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const prizepool::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    prizepool::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const prizepool::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace prizepool::schema::encoding
