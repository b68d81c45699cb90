#include <refuge/ledger/record_store.hpp>
#include <refuge/ledger/sequence.hpp>
#include <refuge/ledger/status_machine.hpp>
#include <refuge/schema/key/builder.hpp>
#include <refuge/schema/key/ledger_keys.hpp>
#include <refuge/storage/memory/storage.hpp>
#include <refuge/storage/rocksdb/storage.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <string>

using namespace refuge::schema;

namespace {

bool is_blank(const std::string& value) {
  return std::ranges::all_of(value, [](const unsigned char c) {
    return std::isspace(c) != 0;
  });
}

std::string lowercase(std::string_view value) {
  auto out = std::string{value};
  std::ranges::transform(out, std::begin(out), [](const unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool contains_folded(std::string_view haystack, const std::string& needle) {
  return lowercase(haystack).find(needle) != std::string::npos;
}

std::set<uint64_t> ids_under(const std::vector<refuge::storage::key_value_entry_t>& rows,
                             std::string_view prefix) {
  auto ids = std::set<uint64_t>{};
  for (const auto& [key, value] : rows) {
    if (auto id = key::parse_u64_suffix(make_bytes_view(key), prefix)) {
      ids.insert(*id);
    }
  }
  return ids;
}

}  // namespace

namespace refuge::ledger {

ledger_error_code validate_record(create_record_t& fields) {
  std::erase_if(fields.needs, is_blank);
  if (fields.location.empty() || is_blank(fields.location)) {
    return ledger_error_code::invalid_record;
  }
  if (fields.amount == 0) {
    return ledger_error_code::invalid_record;
  }
  // Both handles are submitted for decryption by verify_eligibility.
  if (fields.encrypted_identity == make_zero_hash() ||
      fields.encrypted_needs == make_zero_hash()) {
    return ledger_error_code::invalid_record;
  }
  return ledger_error_code::ok;
}

ledger_error_code validate_package(const create_package_t& fields) {
  if (fields.encrypted_resources == make_zero_hash()) {
    return ledger_error_code::invalid_package;
  }
  return ledger_error_code::ok;
}

bool matches(const aid_record_t& record, const record_filter_t& filter) {
  if (filter.status && record.status != *filter.status) {
    return false;
  }
  if (filter.category && record.category != *filter.category) {
    return false;
  }
  if (!filter.search || filter.search->empty()) {
    return true;
  }
  auto term = lowercase(*filter.search);
  if (contains_folded(to_string(record.category), term) ||
      contains_folded(record.location, term)) {
    return true;
  }
  return std::ranges::any_of(record.needs, [&](const std::string& need) {
    return contains_folded(need, term);
  });
}

template <typename Library>
record_store<Library>::record_store(refuge::storage::storage<Library>& storage)
    : storage_{storage} {}

template <typename Library>
aid_record_t record_store<Library>::stage_create(
    refuge::storage::write_batch& batch,
    const caller_id_t& owner,
    const create_record_t& fields,
    timestamp_milliseconds_t now) {
  auto record = aid_record_t{};
  record.id =
      stage_next_id(storage_, encoder_, batch, key::sequence_t::record);
  record.owner = owner;
  record.category = fields.category;
  record.location = fields.location;
  record.amount = fields.amount;
  record.needs = fields.needs;
  record.encrypted_identity = fields.encrypted_identity;
  record.encrypted_location = fields.encrypted_location;
  record.encrypted_needs = fields.encrypted_needs;
  record.status = aid_status_t::pending;
  record.timestamp = now;

  batch.put(key::make_record_key(record.id), encoder_.encode(record));
  batch.put(key::make_record_index_key(record.id), encoder_.encode(record.id));
  spdlog::debug("Staged aid record {}", record.id);
  return record;
}

template <typename Library>
aid_package_t record_store<Library>::stage_create_package(
    refuge::storage::write_batch& batch,
    const caller_id_t& owner,
    const create_package_t& fields,
    timestamp_milliseconds_t now) {
  auto package = aid_package_t{};
  package.id =
      stage_next_id(storage_, encoder_, batch, key::sequence_t::package);
  package.owner = owner;
  package.category = fields.category;
  package.encrypted_resources = fields.encrypted_resources;
  package.encrypted_quantities = fields.encrypted_quantities;
  package.timestamp = now;

  batch.put(key::make_package_key(package.id), encoder_.encode(package));
  spdlog::debug("Staged aid package {}", package.id);
  return package;
}

template <typename Library>
ledger_error_code record_store<Library>::stage_status(
    refuge::storage::write_batch& batch,
    record_id_t id,
    aid_status_t status) {
  auto record = get(batch, id);
  if (!record) {
    return ledger_error_code::not_found;
  }
  if (!can_transition(record->status, status)) {
    spdlog::debug("Refusing status change {} -> {} for record {}",
                  to_string(record->status), to_string(status), id);
    return ledger_error_code::illegal_transition;
  }
  record->status = status;
  batch.put(key::make_record_key(id), encoder_.encode(*record));
  return ledger_error_code::ok;
}

template <typename Library>
std::optional<aid_record_t> record_store<Library>::get(record_id_t id) const {
  auto key = key::make_record_key(id);
  return storage_.template get<aid_record_t>(encoder_, make_bytes_view(key));
}

template <typename Library>
std::optional<aid_record_t> record_store<Library>::get(
    const refuge::storage::write_batch& batch,
    record_id_t id) const {
  auto key = key::make_record_key(id);
  return storage_.template get<aid_record_t>(encoder_, batch,
                                             make_bytes_view(key));
}

template <typename Library>
std::optional<aid_package_t> record_store<Library>::get_package(
    package_id_t id) const {
  auto key = key::make_package_key(id);
  return storage_.template get<aid_package_t>(encoder_, make_bytes_view(key));
}

template <typename Library>
std::vector<record_id_t> record_store<Library>::list_ids() const {
  auto prefix = key::make_prefix_key(key::kRecordIndexKeyPrefix);
  auto rows = storage_.list_by_prefix(make_bytes_view(prefix));
  auto ids = std::vector<record_id_t>{};
  ids.reserve(rows.size());
  for (const auto& [row_key, value] : rows) {
    ids.push_back(encoder_.template decode<record_id_t>(make_bytes_view(value)));
  }
  return ids;
}

template <typename Library>
std::vector<aid_record_t> record_store<Library>::list(
    const record_filter_t& filter) const {
  auto prefix = key::make_prefix_key(key::kRecordKeyPrefix);
  auto rows = storage_.list_by_prefix(make_bytes_view(prefix));
  auto records = std::vector<aid_record_t>{};
  for (auto it = std::rbegin(rows); it != std::rend(rows); ++it) {
    auto record =
        encoder_.template decode<aid_record_t>(make_bytes_view(it->second));
    if (matches(record, filter)) {
      records.push_back(std::move(record));
    }
  }
  return records;
}

template <typename Library>
ledger_stats_t record_store<Library>::stats() const {
  auto stats = ledger_stats_t{};
  for (const auto& record : list(record_filter_t{})) {
    ++stats.total;
    stats.total_amount += record.amount;
    switch (record.status) {
      case aid_status_t::pending:
        ++stats.pending;
        break;
      case aid_status_t::approved:
        ++stats.approved;
        break;
      case aid_status_t::distributed:
        ++stats.distributed;
        break;
      case aid_status_t::rejected:
        ++stats.rejected;
        break;
    }
  }
  stats.packages = package_count();
  return stats;
}

template <typename Library>
uint64_t record_store<Library>::package_count() const {
  auto prefix = key::make_prefix_key(key::kPackageKeyPrefix);
  return storage_.list_by_prefix(make_bytes_view(prefix)).size();
}

template <typename Library>
index_report_t record_store<Library>::check_index() const {
  auto record_prefix = key::make_prefix_key(key::kRecordKeyPrefix);
  auto index_prefix = key::make_prefix_key(key::kRecordIndexKeyPrefix);
  auto records = ids_under(storage_.list_by_prefix(make_bytes_view(record_prefix)),
                           key::kRecordKeyPrefix);
  auto indexed = ids_under(storage_.list_by_prefix(make_bytes_view(index_prefix)),
                           key::kRecordIndexKeyPrefix);

  auto report = index_report_t{};
  report.records = records.size();
  report.index_entries = indexed.size();
  std::ranges::set_difference(indexed, records,
                              std::back_inserter(report.orphans));
  std::ranges::set_difference(records, indexed,
                              std::back_inserter(report.unindexed));
  return report;
}

template <typename Library>
index_report_t record_store<Library>::rebuild_index() {
  auto report = check_index();
  if (report.consistent()) {
    return report;
  }
  spdlog::warn("Rebuilding record index: {} orphan(s), {} unindexed record(s)",
               report.orphans.size(), report.unindexed.size());

  auto record_prefix = key::make_prefix_key(key::kRecordKeyPrefix);
  auto ids = ids_under(storage_.list_by_prefix(make_bytes_view(record_prefix)),
                       key::kRecordKeyPrefix);
  auto entries = std::vector<refuge::storage::key_value_entry_t>{};
  entries.reserve(ids.size());
  for (auto id : ids) {
    entries.emplace_back(key::make_record_index_key(id), encoder_.encode(id));
  }
  auto index_prefix = key::make_prefix_key(key::kRecordIndexKeyPrefix);
  storage_.replace_by_prefix(make_bytes_view(index_prefix), entries);
  return report;
}

template class record_store<refuge::storage::rocksdb_storage_tag>;
template class record_store<refuge::storage::memory_storage_tag>;

}  // namespace refuge::ledger
