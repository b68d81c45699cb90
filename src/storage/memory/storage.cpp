#include <refuge/common/critical.hpp>
#include <refuge/storage/memory/storage.hpp>

#include <algorithm>
#include <spdlog/spdlog.h>

namespace refuge::storage {

namespace {

bool has_prefix(const refuge::schema::bytes_t& key,
                const refuge::schema::bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  static_cast<void>(path);
  auto store = storage<memory_storage_tag>{};
  store.database = std::make_unique<memory_database>();
  spdlog::debug("Opened in-memory ledger storage");
  return store;
}

std::optional<refuge::schema::bytes_t> storage<memory_storage_tag>::get_raw(
    const refuge::schema::bytes_view_t& key) const {
  if (!database) {
    refuge::common::critical("memory database is not initialized");
  }
  auto lock = std::scoped_lock{database->mutex};
  auto it = database->rows.find(refuge::schema::make_bytes(key));
  if (it == std::end(database->rows)) {
    return std::nullopt;
  }
  return it->second;
}

void storage<memory_storage_tag>::commit(const write_batch& batch) const {
  if (!database) {
    refuge::common::critical("memory database is not initialized");
  }
  auto lock = std::scoped_lock{database->mutex};
  for (const auto& [key, value] : batch.staged) {
    if (value.has_value()) {
      database->rows.insert_or_assign(key, *value);
    } else {
      database->rows.erase(key);
    }
  }
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const refuge::schema::bytes_view_t& prefix) const {
  if (!database) {
    refuge::common::critical("memory database is not initialized");
  }
  auto lock = std::scoped_lock{database->mutex};
  auto entries = std::vector<key_value_entry_t>{};
  for (auto it = database->rows.lower_bound(refuge::schema::make_bytes(prefix));
       it != std::end(database->rows) && has_prefix(it->first, prefix); ++it) {
    entries.push_back(*it);
  }
  return entries;
}

void storage<memory_storage_tag>::replace_by_prefix(
    const refuge::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    refuge::common::critical("memory database is not initialized");
  }
  auto lock = std::scoped_lock{database->mutex};
  std::erase_if(database->rows, [&](const auto& row) {
    return has_prefix(row.first, prefix);
  });
  for (const auto& [key, value] : entries) {
    database->rows.insert_or_assign(key, value);
  }
}

}  // namespace refuge::storage
