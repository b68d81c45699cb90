#pragma once

#include <refuge/access/policy.hpp>
#include <refuge/execution/engine.hpp>
#include <refuge/schema/create_package.hpp>
#include <refuge/schema/create_record.hpp>
#include <refuge/schema/primitives.hpp>
#include <refuge/storage/memory/storage.hpp>
#include <refuge/storage/rocksdb/storage.hpp>
#include <refuge/testing/common.hpp>
#include <refuge/testing/decryption_authority.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace refuge::testing {

inline const refuge::schema::caller_id_t& agency() {
  static const auto caller = make_named_caller(0xA0);
  return caller;
}

inline const refuge::schema::caller_id_t& applicant() {
  static const auto caller = make_named_caller(0x10);
  return caller;
}

/// Ledger over the chosen storage backend, wired to an in-process
/// decryption authority, with `agency()` on the allowlist and a clock that
/// ticks one millisecond per call.
template <typename Library>
class ledger_fixture final {
 public:
  explicit ledger_fixture(const std::string_view db_prefix = "refuge_ledger")
      : db_path_{make_db_path(db_prefix)},
        storage_{refuge::storage::make_storage<Library>(db_path_)},
        engine_{storage_, collaborators()} {}

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  ~ledger_fixture() {
    if constexpr (std::is_same_v<Library,
                                 refuge::storage::rocksdb_storage_tag>) {
      storage_.database.reset();
      remove_path(db_path_);
    }
  }

  refuge::execution::engine<Library>& engine() { return engine_; }
  decryption_authority& authority() { return authority_; }
  refuge::storage::storage<Library>& storage() { return storage_; }

  std::vector<refuge::schema::ledger_event_t> delivered_events() const {
    auto lock = std::scoped_lock{sink_mutex_};
    return delivered_;
  }

  refuge::schema::operation_result_t submit_record(
      const std::string& identity,
      const std::string& needs,
      const std::string& location = "camp-north",
      refuge::schema::amount_t amount = 1) {
    auto fields = refuge::schema::create_record_t{};
    fields.category = refuge::schema::aid_category_t::food;
    fields.location = location;
    fields.amount = amount;
    fields.needs = {needs};
    fields.encrypted_identity = authority_.encrypt(identity);
    fields.encrypted_location = authority_.encrypt(location);
    fields.encrypted_needs = authority_.encrypt(needs);
    return engine_.create_record(applicant(), fields);
  }

  refuge::schema::operation_result_t submit_package(
      const std::string& resources) {
    auto fields = refuge::schema::create_package_t{};
    fields.category = refuge::schema::aid_category_t::food;
    fields.encrypted_resources = authority_.encrypt(resources);
    fields.encrypted_quantities = authority_.encrypt(std::string{"10"});
    return engine_.create_package(agency(), fields);
  }

  /// Answer an eligibility request the way the real service would.
  refuge::schema::operation_result_t deliver_eligibility(
      refuge::schema::request_id_t request_id) {
    auto cleartexts = authority_.eligibility_cleartexts(request_id);
    auto proof = authority_.sign(request_id, cleartexts);
    return engine_.perform_verification(
        request_id, refuge::schema::make_bytes_view(cleartexts),
        refuge::schema::make_bytes_view(proof));
  }

  /// Answer a reveal request the way the real service would.
  refuge::schema::operation_result_t deliver_reveal(
      refuge::schema::request_id_t request_id) {
    auto cleartexts = authority_.reveal_cleartexts(request_id);
    auto proof = authority_.sign(request_id, cleartexts);
    return engine_.decrypt_verification(
        request_id, refuge::schema::make_bytes_view(cleartexts),
        refuge::schema::make_bytes_view(proof));
  }

  /// Create a record and package and run phase 1 to completion. Returns the
  /// verification id.
  refuge::schema::verification_id_t complete_verification(
      const std::string& identity,
      const std::string& needs,
      const std::string& resources) {
    auto record = submit_record(identity, needs);
    auto package = submit_package(resources);
    auto requested =
        engine_.verify_eligibility(agency(), *record.id, *package.id);
    return *deliver_eligibility(*requested.id).id;
  }

 private:
  refuge::execution::collaborators_t collaborators() {
    auto collaborators = refuge::execution::collaborators_t{};
    collaborators.submit = authority_.submitter();
    collaborators.encrypt = authority_.encryptor();
    collaborators.verify_proof = authority_.verifier();
    collaborators.authorize =
        refuge::access::make_allowlist_authorizer({agency()});
    collaborators.now = [this] { return ++clock_; };
    collaborators.on_event = [this](const refuge::schema::ledger_event_t& e) {
      auto lock = std::scoped_lock{sink_mutex_};
      delivered_.push_back(e);
    };
    return collaborators;
  }

  std::string db_path_;
  decryption_authority authority_;
  refuge::storage::storage<Library> storage_;
  std::atomic<refuge::schema::timestamp_milliseconds_t> clock_{1'700'000'000'000};
  mutable std::mutex sink_mutex_;
  std::vector<refuge::schema::ledger_event_t> delivered_;
  refuge::execution::engine<Library> engine_;
};

}  // namespace refuge::testing
