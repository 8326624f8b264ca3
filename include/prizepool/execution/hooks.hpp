#pragma once

#include <prizepool/schema/primitives.hpp>
#include <prizepool/schema/transfer_request.hpp>
#include <functional>

namespace prizepool::execution {

/// Move funds between an account and the pool. Returns false when the asset
/// refuses the transfer; the engine then reverts the calling operation.
using asset_transfer_t =
    std::function<bool(const prizepool::schema::transfer_request_t& request)>;

/// Current time in seconds since the epoch.
using time_source_t = std::function<prizepool::schema::timestamp_seconds_t()>;

/// Unpredictability source sampled once per settlement.
using randomness_beacon_t = std::function<prizepool::schema::hash32_t()>;

}  // namespace prizepool::execution
