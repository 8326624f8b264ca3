#pragma once

#include <prizepool/execution/hooks.hpp>
#include <prizepool/schema/encoding/encoder.hpp>
#include <prizepool/schema/primitives.hpp>
#include <prizepool/schema/transfer_request.hpp>
#include <prizepool/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

namespace prizepool::execution {

using outbox_entry_t = std::pair<uint64_t, prizepool::schema::transfer_request_t>;

/// Persistent queue of asset movements for an external settlement process.
///
/// Installed as the engine's asset transfer hook by the CLI: every pull and
/// push is accepted and appended under a sequence number in the same
/// database as the pool state.
class transfer_outbox final {
 public:
  transfer_outbox(
      prizepool::schema::encoding::encoder<
          prizepool::schema::encoding::scale_encoder_tag>& encoder,
      prizepool::storage::storage<prizepool::storage::rocksdb_storage_tag>&
          storage);

  /// Append a request. Returns the sequence number it was stored under.
  uint64_t append(const prizepool::schema::transfer_request_t& request);

  /// Every stored request in sequence order.
  std::vector<outbox_entry_t> list() const;

  /// Hook that appends each request and reports success.
  asset_transfer_t hook();

 private:
  prizepool::schema::encoding::encoder<
      prizepool::schema::encoding::scale_encoder_tag>& encoder_;
  prizepool::storage::storage<prizepool::storage::rocksdb_storage_tag>&
      storage_;
  mutable std::mutex mutex_;
};

}  // namespace prizepool::execution
