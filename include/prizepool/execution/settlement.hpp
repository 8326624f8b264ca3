#pragma once

#include <prizepool/schema/primitives.hpp>
#include <cstdint>

namespace prizepool::execution {

/// Simple (non-compounding) interest:
/// principal * rate_bps * duration / (10000 * seconds_per_year), floored.
prizepool::schema::amount_t compute_interest(
    const prizepool::schema::amount_t& principal,
    prizepool::schema::basis_points_t rate_bps,
    prizepool::schema::duration_seconds_t duration);

/// BLAKE3 over the SCALE encoding of (beacon, vault_id, now).
prizepool::schema::hash32_t derive_seed(
    const prizepool::schema::hash32_t& beacon,
    prizepool::schema::vault_id_t vault_id,
    prizepool::schema::timestamp_seconds_t now);

/// Reduce the seed, read as a big-endian 256-bit integer, modulo `count`.
/// `count` must be non-zero.
uint64_t select_index(const prizepool::schema::hash32_t& seed, uint64_t count);

}  // namespace prizepool::execution
