#pragma once
#include <prizepool/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace prizepool::storage {

using key_value_entry_t =
    std::pair<prizepool::schema::bytes_t, prizepool::schema::bytes_t>;

/// One mutation inside an atomic batch. An empty `value` deletes `key`.
struct write_entry final {
  prizepool::schema::bytes_t key;
  std::optional<prizepool::schema::bytes_t> value;
};

using write_batch_t = std::vector<write_entry>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const prizepool::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const prizepool::schema::bytes_view_t& key,
           const T& value) const;

  /// Return the raw bytes stored at key, or std::nullopt when missing.
  std::optional<prizepool::schema::bytes_t> get_raw(
      const prizepool::schema::bytes_view_t& key) const;

  /// Apply every entry of the batch atomically.
  void commit(const write_batch_t& batch) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const prizepool::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace prizepool::storage
