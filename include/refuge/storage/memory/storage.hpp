#pragma once
#include <refuge/storage/storage.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>

namespace refuge::storage {

/// Process-local ordered map. Used by tests and tooling that must not touch
/// disk; mirrors the RocksDB backend's ordering and batch atomicity.
struct memory_storage_tag {};

struct memory_database final {
  mutable std::mutex mutex;
  std::map<refuge::schema::bytes_t, refuge::schema::bytes_t> rows;
};

template <>
struct storage<memory_storage_tag> final {
  std::unique_ptr<memory_database> database;

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
           const T& value) const {
    auto batch = write_batch{};
    batch.put(refuge::schema::make_bytes(key), encoder.encode(value));
    commit(batch);
  }

  void commit(const write_batch& batch) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const refuge::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const refuge::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

/// `path` is accepted for signature parity with the other backends and is
/// not used.
template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

}  // namespace refuge::storage
