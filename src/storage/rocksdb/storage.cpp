#include <prizepool/common/critical.hpp>
#include <prizepool/storage/rocksdb/storage.hpp>

namespace prizepool::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    prizepool::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<prizepool::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const prizepool::schema::bytes_view_t& key) const {
  if (!database) {
    prizepool::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    prizepool::common::critical("Failed to get value from RocksDB");
  }
  return prizepool::schema::bytes_t(std::begin(value), std::end(value));
}

void storage<rocksdb_storage_tag>::commit(const write_batch_t& batch) const {
  if (!database) {
    prizepool::common::critical("RocksDB database is not initialized");
  }
  if (batch.empty()) {
    return;
  }

  auto write_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& entry : batch) {
    auto key_slice = detail::to_slice(
        prizepool::schema::bytes_view_t{entry.key.data(), entry.key.size()});
    auto status = ROCKSDB_NAMESPACE::Status{};
    if (entry.value.has_value()) {
      status = write_batch.Put(
          key_slice, detail::to_slice(prizepool::schema::bytes_view_t{
                         entry.value->data(), entry.value->size()}));
    } else {
      status = write_batch.Delete(key_slice);
    }
    if (!status.ok()) {
      prizepool::common::critical("failed staging key in write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &write_batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit RocksDB write batch: {}",
                  write_status.ToString());
    prizepool::common::critical("failed to commit write batch");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const prizepool::schema::bytes_view_t& prefix) const {
  if (!database) {
    prizepool::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    prizepool::common::critical("failed iterating RocksDB prefix");
  }
  return entries;
}

}  // namespace prizepool::storage
