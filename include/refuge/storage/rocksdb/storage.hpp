#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <refuge/common/critical.hpp>
#include <refuge/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace refuge::storage {

namespace detail {

inline refuge::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const refuge::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<refuge::schema::bytes_t> get_raw(
      const refuge::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const refuge::schema::bytes_view_t& key) const {
    return detail::decoded_get<T>(*this, encoder, key);
  }

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const write_batch& batch,
                       const refuge::schema::bytes_view_t& key) const {
    return detail::staged_get<T>(*this, encoder, batch, key);
  }

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const refuge::schema::bytes_view_t& key,
           const T& value) const;

  void commit(const write_batch& batch) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const refuge::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const refuge::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const refuge::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    refuge::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(refuge::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    refuge::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace refuge::storage
