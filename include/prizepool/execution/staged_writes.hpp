#pragma once

#include <prizepool/schema/encoding/scale/encoder.hpp>
#include <prizepool/schema/primitives.hpp>
#include <prizepool/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>

namespace prizepool::execution {

/// Write set for one engine operation.
///
/// Reads see the operation's own pending writes first, then storage. The
/// value each touched key held before the operation is remembered so a
/// committed write set can be undone when an outbound transfer is refused.
class staged_writes final {
 public:
  using encoder_t = prizepool::schema::encoding::encoder<
      prizepool::schema::encoding::scale_encoder_tag>;
  using storage_t =
      prizepool::storage::storage<prizepool::storage::rocksdb_storage_tag>;

  staged_writes(encoder_t& encoder, storage_t& storage)
      : encoder_{encoder}, storage_{storage} {}

  template <typename T>
  std::optional<T> get(const prizepool::schema::bytes_t& key) const {
    auto raw = read(key);
    if (!raw.has_value()) {
      return std::nullopt;
    }
    return encoder_.decode<T>(
        prizepool::schema::bytes_view_t{raw->data(), raw->size()});
  }

  template <typename T>
  void put(const prizepool::schema::bytes_t& key, const T& value) {
    remember(key);
    pending_[key] = encoder_.encode(value);
  }

  void erase(const prizepool::schema::bytes_t& key) {
    remember(key);
    pending_[key] = std::nullopt;
  }

  /// Entries that apply the pending writes.
  prizepool::storage::write_batch_t batch() const {
    auto out = prizepool::storage::write_batch_t{};
    out.reserve(pending_.size());
    for (const auto& [key, value] : pending_) {
      out.push_back(prizepool::storage::write_entry{.key = key, .value = value});
    }
    return out;
  }

  /// Entries that restore every touched key to its prior value.
  prizepool::storage::write_batch_t undo_batch() const {
    auto out = prizepool::storage::write_batch_t{};
    out.reserve(before_.size());
    for (const auto& [key, value] : before_) {
      out.push_back(prizepool::storage::write_entry{.key = key, .value = value});
    }
    return out;
  }

 private:
  std::optional<prizepool::schema::bytes_t> read(
      const prizepool::schema::bytes_t& key) const {
    if (auto staged = pending_.find(key); staged != std::end(pending_)) {
      return staged->second;
    }
    return storage_.get_raw(
        prizepool::schema::bytes_view_t{key.data(), key.size()});
  }

  void remember(const prizepool::schema::bytes_t& key) {
    if (before_.contains(key)) {
      return;
    }
    before_.emplace(key, storage_.get_raw(prizepool::schema::bytes_view_t{
                             key.data(), key.size()}));
  }

  encoder_t& encoder_;
  storage_t& storage_;
  std::map<prizepool::schema::bytes_t, std::optional<prizepool::schema::bytes_t>>
      pending_;
  std::map<prizepool::schema::bytes_t, std::optional<prizepool::schema::bytes_t>>
      before_;
};

}  // namespace prizepool::execution
