#include <prizepool/blake3/hash.hpp>
#include <prizepool/common/critical.hpp>
#include <prizepool/execution/settlement.hpp>
#include <prizepool/schema/encoding/scale/encoder.hpp>

#include <iterator>
#include <tuple>

namespace prizepool::execution {

namespace {

using encoder_t = prizepool::schema::encoding::encoder<
    prizepool::schema::encoding::scale_encoder_tag>;

}  // namespace

prizepool::schema::amount_t compute_interest(
    const prizepool::schema::amount_t& principal,
    const prizepool::schema::basis_points_t rate_bps,
    const prizepool::schema::duration_seconds_t duration) {
  static const auto kDenominator =
      prizepool::schema::amount_t{prizepool::schema::kBasisPointsDenominator} *
      prizepool::schema::kSecondsPerYear;
  return (principal * rate_bps * duration) / kDenominator;
}

prizepool::schema::hash32_t derive_seed(
    const prizepool::schema::hash32_t& beacon,
    const prizepool::schema::vault_id_t vault_id,
    const prizepool::schema::timestamp_seconds_t now) {
  auto encoder = encoder_t{};
  auto material = encoder.encode(std::tuple{beacon, vault_id, now});
  return prizepool::blake3::hash(
      prizepool::schema::bytes_view_t{material.data(), material.size()});
}

uint64_t select_index(const prizepool::schema::hash32_t& seed,
                      const uint64_t count) {
  if (count == 0) {
    prizepool::common::critical("select_index called with an empty set");
  }
  auto value = prizepool::schema::amount_t{};
  boost::multiprecision::import_bits(value, std::begin(seed), std::end(seed),
                                     8, true);
  return static_cast<uint64_t>(value % count);
}

}  // namespace prizepool::execution
