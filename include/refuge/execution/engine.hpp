#pragma once

#include <refuge/access/policy.hpp>
#include <refuge/ledger/correlation_table.hpp>
#include <refuge/ledger/event_log.hpp>
#include <refuge/ledger/record_store.hpp>
#include <refuge/ledger/scoring.hpp>
#include <refuge/ledger/verification_engine.hpp>
#include <refuge/oracle/capabilities.hpp>
#include <refuge/schema/aid_package.hpp>
#include <refuge/schema/aid_record.hpp>
#include <refuge/schema/create_package.hpp>
#include <refuge/schema/create_record.hpp>
#include <refuge/schema/decrypted_result.hpp>
#include <refuge/schema/ledger_event.hpp>
#include <refuge/schema/ledger_info.hpp>
#include <refuge/schema/ledger_stats.hpp>
#include <refuge/schema/operation_result.hpp>
#include <refuge/schema/operation_type.hpp>
#include <refuge/schema/pending_decryption.hpp>
#include <refuge/schema/primitives.hpp>
#include <refuge/schema/query_result.hpp>
#include <refuge/schema/record_filter.hpp>
#include <refuge/schema/verification.hpp>
#include <refuge/storage/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace refuge::execution {

inline constexpr std::string_view kRecordsCodespace{"refuge.records"};
inline constexpr std::string_view kQueryCodespace{"refuge.query"};

using clock_function_t =
    std::function<refuge::schema::timestamp_milliseconds_t()>;

/// Milliseconds since the Unix epoch from the system clock.
refuge::schema::timestamp_milliseconds_t system_now();

/// Everything the ledger depends on outside its own storage.
///
/// A missing `submit` or `encrypt` leaves the ledger readable but makes the
/// verification calls fail with the matching `*_unavailable` code. A missing
/// `authorize` denies every gated operation. `score`, `now` and `on_event`
/// fall back to the default formula, the system clock and no sink. With
/// `repair_index_on_open` off, a drifted record index is only reported.
struct collaborators_t final {
  refuge::oracle::decryption_submitter_t submit;
  refuge::oracle::encryptor_t encrypt;
  refuge::oracle::proof_verifier_t verify_proof;
  refuge::access::authorizer_t authorize;
  refuge::ledger::scoring_function_t score;
  clock_function_t now;
  refuge::ledger::event_sink_t on_event;
  bool repair_index_on_open{true};
};

/// Confidential aid ledger.
///
/// Every call, reads included, runs under one mutex, and each mutating call
/// commits its writes as a single batch only when it succeeds. Decryption
/// callbacks arrive through `perform_verification` and
/// `decrypt_verification`; they are gated by proof, not by caller.
///
/// The event sink runs under the ledger lock and must not call back in.
template <typename Library>
class engine final {
 public:
  /// Open the ledger over `storage`. Repairs the record index when it has
  /// drifted from the stored records, unless the collaborators turn that off.
  engine(refuge::storage::storage<Library>& storage,
         collaborators_t collaborators);

  refuge::schema::operation_result_t create_record(
      const refuge::schema::caller_id_t& caller,
      refuge::schema::create_record_t fields);

  refuge::schema::operation_result_t create_package(
      const refuge::schema::caller_id_t& caller,
      const refuge::schema::create_package_t& fields);

  /// Phase 1: submit the record's and package's handles for decryption.
  /// On success `id` is the issued request id.
  refuge::schema::operation_result_t verify_eligibility(
      const refuge::schema::caller_id_t& caller,
      refuge::schema::record_id_t record_id,
      refuge::schema::package_id_t package_id);

  /// Callback for phase 1. On success `id` is the new verification id.
  refuge::schema::operation_result_t perform_verification(
      refuge::schema::request_id_t request_id,
      const refuge::schema::bytes_view_t& cleartexts,
      const refuge::schema::bytes_view_t& proof);

  /// Phase 2: submit a verification's encrypted scores for reveal.
  /// On success `id` is the issued request id.
  refuge::schema::operation_result_t request_verification_result(
      const refuge::schema::caller_id_t& caller,
      refuge::schema::verification_id_t verification_id);

  /// Callback for phase 2. A result that is already revealed keeps its
  /// values; the request is consumed and the call still succeeds.
  refuge::schema::operation_result_t decrypt_verification(
      refuge::schema::request_id_t request_id,
      const refuge::schema::bytes_view_t& cleartexts,
      const refuge::schema::bytes_view_t& proof);

  refuge::schema::operation_result_t approve_record(
      const refuge::schema::caller_id_t& caller,
      refuge::schema::record_id_t id);

  refuge::schema::operation_result_t distribute_record(
      const refuge::schema::caller_id_t& caller,
      refuge::schema::record_id_t id);

  refuge::schema::operation_result_t reject_record(
      const refuge::schema::caller_id_t& caller,
      refuge::schema::record_id_t id);

  std::optional<refuge::schema::aid_record_t> get_record(
      refuge::schema::record_id_t id) const;
  std::vector<refuge::schema::record_id_t> list_record_ids() const;
  std::vector<refuge::schema::aid_record_t> list_records(
      const refuge::schema::record_filter_t& filter) const;
  std::optional<refuge::schema::aid_package_t> get_package(
      refuge::schema::package_id_t id) const;
  std::optional<refuge::schema::verification_t> get_verification(
      refuge::schema::verification_id_t id) const;
  std::optional<refuge::schema::decrypted_result_t> get_result(
      refuge::schema::verification_id_t id) const;
  std::vector<refuge::schema::pending_decryption_t> outstanding_requests()
      const;
  std::vector<refuge::schema::ledger_event_t> events(uint64_t from,
                                                     uint64_t to) const;
  refuge::schema::ledger_stats_t stats() const;
  refuge::schema::ledger_info_t info() const;

  refuge::ledger::index_report_t check_index() const;
  refuge::ledger::index_report_t rebuild_index();

  /// Id of the first event that breaks the hash chain, if any.
  std::optional<uint64_t> verify_event_chain() const;

  /// Execute a read-path query by route.
  refuge::schema::query_result_t query(
      std::string_view path,
      const refuge::schema::bytes_view_t& data) const;

  /// True when decryption submission, encryption and proof checking were all
  /// supplied.
  bool available() const;

 private:
  /// Run `stage` against a fresh batch and commit it when it succeeds.
  template <typename Stage>
  refuge::schema::operation_result_t execute(Stage&& stage);

  std::optional<refuge::schema::operation_result_t> deny_unless_authorized(
      const refuge::schema::caller_id_t& caller,
      refuge::schema::operation_type_t operation) const;

  refuge::schema::operation_result_t change_status(
      const refuge::schema::caller_id_t& caller,
      refuge::schema::operation_type_t operation,
      refuge::schema::record_id_t id);

  refuge::schema::ledger_stats_t stats_unlocked() const;
  refuge::schema::ledger_info_t info_unlocked() const;

  mutable std::mutex mutex_;
  refuge::storage::storage<Library>& storage_;
  refuge::access::authorizer_t authorize_;
  clock_function_t now_;
  refuge::ledger::event_sink_t on_event_;
  refuge::ledger::record_store<Library> records_;
  refuge::ledger::correlation_table<Library> correlations_;
  refuge::ledger::event_log<Library> events_;
  refuge::ledger::verification_engine<Library> verifier_;
};

}  // namespace refuge::execution
