#pragma once
#include <refuge/schema/primitives.hpp>
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace refuge::storage {

using key_value_entry_t =
    std::pair<refuge::schema::bytes_t, refuge::schema::bytes_t>;

/// Puts and deletes staged by one ledger call and committed atomically.
///
/// A staged value of std::nullopt marks the key for deletion. Reads made
/// through `storage::get` with a batch observe staged writes first.
struct write_batch final {
  std::map<refuge::schema::bytes_t, std::optional<refuge::schema::bytes_t>>
      staged;

  void put(refuge::schema::bytes_t key, refuge::schema::bytes_t value) {
    staged.insert_or_assign(std::move(key), std::move(value));
  }

  void erase(refuge::schema::bytes_t key) {
    staged.insert_or_assign(std::move(key), std::nullopt);
  }

  const std::optional<refuge::schema::bytes_t>* find(
      const refuge::schema::bytes_view_t& key) const {
    auto it = staged.find(refuge::schema::make_bytes(key));
    if (it == std::end(staged)) {
      return nullptr;
    }
    return &it->second;
  }

  bool empty() const { return staged.empty(); }
};

template <typename Library>
struct storage {
  /// Return raw bytes at key, or std::nullopt when missing.
  std::optional<refuge::schema::bytes_t> get_raw(
      const refuge::schema::bytes_view_t& key) const;

  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const refuge::schema::bytes_view_t& key) const;

  /// Same as `get`, but staged writes in `batch` shadow committed values.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const write_batch& batch,
                       const refuge::schema::bytes_view_t& key) const;

  /// Encode and persist value at key outside of any batch.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const refuge::schema::bytes_view_t& key,
           const T& value) const;

  /// Apply every staged put and delete as one atomic write.
  void commit(const write_batch& batch) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const refuge::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const refuge::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

namespace detail {

template <typename T, typename Storage, typename Encoder>
std::optional<T> staged_get(const Storage& store,
                            Encoder& encoder,
                            const write_batch& batch,
                            const refuge::schema::bytes_view_t& key) {
  if (const auto* staged = batch.find(key)) {
    if (!staged->has_value()) {
      return std::nullopt;
    }
    return encoder.template decode<T>(refuge::schema::bytes_view_t{
        staged->value().data(), staged->value().size()});
  }
  return store.template get<T>(encoder, key);
}

template <typename T, typename Storage, typename Encoder>
std::optional<T> decoded_get(const Storage& store,
                             Encoder& encoder,
                             const refuge::schema::bytes_view_t& key) {
  auto raw = store.get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  return encoder.template decode<T>(
      refuge::schema::bytes_view_t{raw->data(), raw->size()});
}

}  // namespace detail

}  // namespace refuge::storage
