#include <refuge/common/critical.hpp>
#include <refuge/storage/rocksdb/storage.hpp>

#include <string>

namespace refuge::storage {

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
    refuge::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<refuge::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const refuge::schema::bytes_view_t& key) const {
  if (!database) {
    refuge::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    refuge::common::critical("Failed to get value from RocksDB");
  }
  return refuge::schema::bytes_t(std::begin(value), std::end(value));
}

void storage<rocksdb_storage_tag>::commit(const write_batch& batch) const {
  if (!database) {
    refuge::common::critical("RocksDB database is not initialized");
  }
  if (batch.empty()) {
    return;
  }

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : batch.staged) {
    auto key_slice = detail::to_slice(
        refuge::schema::bytes_view_t{key.data(), key.size()});
    auto status =
        value.has_value()
            ? rocks_batch.Put(key_slice,
                              detail::to_slice(refuge::schema::bytes_view_t{
                                  value->data(), value->size()}))
            : rocks_batch.Delete(key_slice);
    if (!status.ok()) {
      refuge::common::critical("failed staging key into RocksDB batch");
    }
  }

  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    refuge::common::critical("failed to commit ledger batch");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const refuge::schema::bytes_view_t& prefix) const {
  if (!database) {
    refuge::common::critical("RocksDB database is not initialized");
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
    refuge::common::critical("failed to iterate RocksDB prefix");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::replace_by_prefix(
    const refuge::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    refuge::common::critical("RocksDB database is not initialized");
  }

  auto batch = write_batch{};
  for (auto& [key, value] : list_by_prefix(prefix)) {
    batch.erase(key);
  }
  for (const auto& [key, value] : entries) {
    batch.put(key, value);
  }
  commit(batch);
}

}  // namespace refuge::storage
