#pragma once
#include <refuge/schema/aid_package.hpp>
#include <refuge/schema/aid_record.hpp>
#include <refuge/schema/create_package.hpp>
#include <refuge/schema/create_record.hpp>
#include <refuge/schema/encoding/scale/encoder.hpp>
#include <refuge/schema/ledger_error_code.hpp>
#include <refuge/schema/ledger_stats.hpp>
#include <refuge/schema/record_filter.hpp>
#include <refuge/storage/storage.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace refuge::ledger {

struct index_report_t final {
  uint64_t records{};
  uint64_t index_entries{};
  // Index entries without a record.
  std::vector<refuge::schema::record_id_t> orphans;
  // Records missing from the index.
  std::vector<refuge::schema::record_id_t> unindexed;

  bool consistent() const { return orphans.empty() && unindexed.empty(); }
};

/// Normalize and check a submission. Blank needs entries are dropped in
/// place; an empty location, a zero amount or an unset identity or needs
/// handle is rejected.
refuge::schema::ledger_error_code validate_record(
    refuge::schema::create_record_t& fields);

refuge::schema::ledger_error_code validate_package(
    const refuge::schema::create_package_t& fields);

/// Aid records, their append-only id index, and aid packages.
///
/// `stage_*` members only write into the supplied batch; the caller commits.
template <typename Library>
class record_store final {
 public:
  explicit record_store(refuge::storage::storage<Library>& storage);

  /// Stage a new record, its index entry and the record sequence. `fields`
  /// must already have passed `validate_record`.
  refuge::schema::aid_record_t stage_create(
      refuge::storage::write_batch& batch,
      const refuge::schema::caller_id_t& owner,
      const refuge::schema::create_record_t& fields,
      refuge::schema::timestamp_milliseconds_t now);

  refuge::schema::aid_package_t stage_create_package(
      refuge::storage::write_batch& batch,
      const refuge::schema::caller_id_t& owner,
      const refuge::schema::create_package_t& fields,
      refuge::schema::timestamp_milliseconds_t now);

  /// Stage a status change. Returns not_found or illegal_transition without
  /// touching the batch when the change is not allowed.
  refuge::schema::ledger_error_code stage_status(
      refuge::storage::write_batch& batch,
      refuge::schema::record_id_t id,
      refuge::schema::aid_status_t status);

  std::optional<refuge::schema::aid_record_t> get(
      refuge::schema::record_id_t id) const;
  std::optional<refuge::schema::aid_record_t> get(
      const refuge::storage::write_batch& batch,
      refuge::schema::record_id_t id) const;

  std::optional<refuge::schema::aid_package_t> get_package(
      refuge::schema::package_id_t id) const;

  /// Ids in insertion order, read from the index.
  std::vector<refuge::schema::record_id_t> list_ids() const;

  /// Matching records, newest first.
  std::vector<refuge::schema::aid_record_t> list(
      const refuge::schema::record_filter_t& filter) const;

  refuge::schema::ledger_stats_t stats() const;

  uint64_t package_count() const;

  index_report_t check_index() const;

  /// Re-derive the index from stored records and replace it atomically.
  index_report_t rebuild_index();

 private:
  refuge::storage::storage<Library>& storage_;
  mutable refuge::schema::encoding::encoder<
      refuge::schema::encoding::scale_encoder_tag>
      encoder_;
};

/// True when `record` passes every criterion set in `filter`.
bool matches(const refuge::schema::aid_record_t& record,
             const refuge::schema::record_filter_t& filter);

}  // namespace refuge::ledger
