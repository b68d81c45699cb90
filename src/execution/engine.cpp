#include <refuge/common/critical.hpp>
#include <refuge/execution/engine.hpp>
#include <refuge/ledger/status_machine.hpp>
#include <refuge/schema/encoding/scale/encoder.hpp>
#include <refuge/schema/query_error_code.hpp>
#include <refuge/storage/memory/storage.hpp>
#include <refuge/storage/rocksdb/storage.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <tuple>
#include <utility>

using namespace refuge::schema;

namespace {

using encoder_t = refuge::schema::encoding::encoder<
    refuge::schema::encoding::scale_encoder_tag>;

refuge::schema::query_result_t make_query_error(
    refuge::schema::query_error_code code,
    std::string_view log,
    const refuge::schema::bytes_view_t& key) {
  auto result = refuge::schema::query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.key = refuge::schema::make_bytes(key);
  result.codespace = std::string{refuge::execution::kQueryCodespace};
  return result;
}

template <typename T>
refuge::schema::query_result_t make_query_value(
    const refuge::schema::bytes_view_t& key,
    const T& value) {
  auto encoder = encoder_t{};
  auto result = refuge::schema::query_result_t{};
  result.key = refuge::schema::make_bytes(key);
  result.value = encoder.encode(value);
  result.codespace = std::string{refuge::execution::kQueryCodespace};
  return result;
}

template <typename T>
refuge::schema::query_result_t make_query_optional(
    const refuge::schema::bytes_view_t& key,
    const std::optional<T>& value) {
  if (!value) {
    return make_query_error(refuge::schema::query_error_code::not_found,
                            "not found", key);
  }
  return make_query_value(key, *value);
}

}  // namespace

namespace refuge::execution {

timestamp_milliseconds_t system_now() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

template <typename Library>
engine<Library>::engine(refuge::storage::storage<Library>& storage,
                        collaborators_t collaborators)
    : storage_{storage},
      authorize_{std::move(collaborators.authorize)},
      now_{std::move(collaborators.now)},
      on_event_{std::move(collaborators.on_event)},
      records_{storage},
      correlations_{storage},
      events_{storage},
      verifier_{storage, records_, correlations_, events_,
                refuge::ledger::oracle_t{
                    .submit = std::move(collaborators.submit),
                    .encrypt = std::move(collaborators.encrypt),
                    .verify_proof = std::move(collaborators.verify_proof),
                    .score = std::move(collaborators.score)}} {
  auto lock = std::scoped_lock{mutex_};
  if (!now_) {
    now_ = system_now;
  }
  if (!authorize_) {
    spdlog::warn("No authorizer configured; gated operations will be denied");
  }
  if (!verifier_.available()) {
    spdlog::warn("Decryption capabilities missing; verification disabled");
  }

  auto report = records_.check_index();
  if (!report.consistent()) {
    if (collaborators.repair_index_on_open) {
      records_.rebuild_index();
    } else {
      spdlog::warn("Record index has {} orphan(s) and {} unindexed record(s)",
                   report.orphans.size(), report.unindexed.size());
    }
  }
  spdlog::info("Aid ledger ready with {} record(s) and {} event(s)",
               report.records, events_.count());
}

template <typename Library>
template <typename Stage>
operation_result_t engine<Library>::execute(Stage&& stage) {
  auto batch = refuge::storage::write_batch{};
  auto result = stage(batch, now_());
  if (!succeeded(result)) {
    spdlog::debug("Discarding {} staged write(s): {}", batch.staged.size(),
                  result.log);
    return result;
  }
  storage_.commit(batch);
  for (const auto& event : result.events) {
    spdlog::info("Event {} {} entity={}", event.event_id, to_string(event.type),
                 event.entity_id);
    if (on_event_) {
      on_event_(event);
    }
  }
  return result;
}

template <typename Library>
std::optional<operation_result_t> engine<Library>::deny_unless_authorized(
    const caller_id_t& caller,
    operation_type_t operation) const {
  if (authorize_ && authorize_(caller, operation)) {
    return std::nullopt;
  }
  spdlog::warn("Denied {} for unauthorized caller", to_string(operation));
  auto codespace = operation == operation_type_t::verify_eligibility ||
                           operation ==
                               operation_type_t::request_verification_result
                       ? refuge::ledger::kVerificationCodespace
                       : kRecordsCodespace;
  return refuge::ledger::make_error_result(ledger_error_code::unauthorized,
                                           codespace,
                                           std::string{to_string(operation)});
}

template <typename Library>
operation_result_t engine<Library>::create_record(const caller_id_t& caller,
                                                  create_record_t fields) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          deny_unless_authorized(caller, operation_type_t::create_record)) {
    return *denied;
  }
  return execute([&](refuge::storage::write_batch& batch,
                     timestamp_milliseconds_t now) {
    auto code = refuge::ledger::validate_record(fields);
    if (code != ledger_error_code::ok) {
      return refuge::ledger::make_error_result(code, kRecordsCodespace);
    }
    auto record = records_.stage_create(batch, caller, fields, now);
    auto result = operation_result_t{};
    result.id = record.id;
    result.info = "record registered";
    result.codespace = std::string{kRecordsCodespace};
    result.events.push_back(events_.stage(
        batch, ledger_event_type_t::record_registered, record.id,
        std::nullopt, now));
    return result;
  });
}

template <typename Library>
operation_result_t engine<Library>::create_package(
    const caller_id_t& caller,
    const create_package_t& fields) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          deny_unless_authorized(caller, operation_type_t::create_package)) {
    return *denied;
  }
  return execute([&](refuge::storage::write_batch& batch,
                     timestamp_milliseconds_t now) {
    auto code = refuge::ledger::validate_package(fields);
    if (code != ledger_error_code::ok) {
      return refuge::ledger::make_error_result(code, kRecordsCodespace);
    }
    auto package = records_.stage_create_package(batch, caller, fields, now);
    auto result = operation_result_t{};
    result.id = package.id;
    result.info = "package created";
    result.codespace = std::string{kRecordsCodespace};
    result.events.push_back(events_.stage(
        batch, ledger_event_type_t::package_created, package.id, std::nullopt,
        now));
    return result;
  });
}

template <typename Library>
operation_result_t engine<Library>::verify_eligibility(
    const caller_id_t& caller,
    record_id_t record_id,
    package_id_t package_id) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = deny_unless_authorized(
          caller, operation_type_t::verify_eligibility)) {
    return *denied;
  }
  return execute([&](refuge::storage::write_batch& batch,
                     timestamp_milliseconds_t now) {
    return verifier_.verify_eligibility(batch, record_id, package_id, now);
  });
}

template <typename Library>
operation_result_t engine<Library>::perform_verification(
    request_id_t request_id,
    const bytes_view_t& cleartexts,
    const bytes_view_t& proof) {
  auto lock = std::scoped_lock{mutex_};
  return execute([&](refuge::storage::write_batch& batch,
                     timestamp_milliseconds_t now) {
    return verifier_.perform_verification(batch, request_id, cleartexts, proof,
                                          now);
  });
}

template <typename Library>
operation_result_t engine<Library>::request_verification_result(
    const caller_id_t& caller,
    verification_id_t verification_id) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = deny_unless_authorized(
          caller, operation_type_t::request_verification_result)) {
    return *denied;
  }
  return execute([&](refuge::storage::write_batch& batch,
                     timestamp_milliseconds_t now) {
    return verifier_.request_verification_result(batch, verification_id, now);
  });
}

template <typename Library>
operation_result_t engine<Library>::decrypt_verification(
    request_id_t request_id,
    const bytes_view_t& cleartexts,
    const bytes_view_t& proof) {
  auto lock = std::scoped_lock{mutex_};
  return execute([&](refuge::storage::write_batch& batch,
                     timestamp_milliseconds_t now) {
    return verifier_.decrypt_verification(batch, request_id, cleartexts, proof,
                                          now);
  });
}

template <typename Library>
operation_result_t engine<Library>::change_status(const caller_id_t& caller,
                                                  operation_type_t operation,
                                                  record_id_t id) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = deny_unless_authorized(caller, operation)) {
    return *denied;
  }
  auto status = refuge::ledger::target_status(operation);
  if (!status) {
    refuge::common::critical("status change requested for non-status operation");
  }
  return execute([&](refuge::storage::write_batch& batch,
                     timestamp_milliseconds_t now) {
    auto code = records_.stage_status(batch, id, *status);
    if (code != ledger_error_code::ok) {
      return refuge::ledger::make_error_result(
          code, kRecordsCodespace, std::string{to_string(operation)});
    }
    auto result = operation_result_t{};
    result.id = id;
    result.info = std::string{to_string(*status)};
    result.codespace = std::string{kRecordsCodespace};
    if (auto type = refuge::ledger::status_event(*status)) {
      result.events.push_back(
          events_.stage(batch, *type, id, std::nullopt, now));
    }
    return result;
  });
}

template <typename Library>
operation_result_t engine<Library>::approve_record(const caller_id_t& caller,
                                                   record_id_t id) {
  return change_status(caller, operation_type_t::approve_record, id);
}

template <typename Library>
operation_result_t engine<Library>::distribute_record(
    const caller_id_t& caller,
    record_id_t id) {
  return change_status(caller, operation_type_t::distribute_record, id);
}

template <typename Library>
operation_result_t engine<Library>::reject_record(const caller_id_t& caller,
                                                  record_id_t id) {
  return change_status(caller, operation_type_t::reject_record, id);
}

template <typename Library>
std::optional<aid_record_t> engine<Library>::get_record(record_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return records_.get(id);
}

template <typename Library>
std::vector<record_id_t> engine<Library>::list_record_ids() const {
  auto lock = std::scoped_lock{mutex_};
  return records_.list_ids();
}

template <typename Library>
std::vector<aid_record_t> engine<Library>::list_records(
    const record_filter_t& filter) const {
  auto lock = std::scoped_lock{mutex_};
  return records_.list(filter);
}

template <typename Library>
std::optional<aid_package_t> engine<Library>::get_package(
    package_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return records_.get_package(id);
}

template <typename Library>
std::optional<verification_t> engine<Library>::get_verification(
    verification_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return verifier_.get_verification(id);
}

template <typename Library>
std::optional<decrypted_result_t> engine<Library>::get_result(
    verification_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return verifier_.get_result(id);
}

template <typename Library>
std::vector<pending_decryption_t> engine<Library>::outstanding_requests()
    const {
  auto lock = std::scoped_lock{mutex_};
  return correlations_.outstanding();
}

template <typename Library>
std::vector<ledger_event_t> engine<Library>::events(uint64_t from,
                                                    uint64_t to) const {
  auto lock = std::scoped_lock{mutex_};
  return events_.list(from, to);
}

template <typename Library>
ledger_stats_t engine<Library>::stats_unlocked() const {
  auto stats = records_.stats();
  stats.verifications = verifier_.verification_count();
  stats.outstanding_requests = correlations_.outstanding().size();
  return stats;
}

template <typename Library>
ledger_stats_t engine<Library>::stats() const {
  auto lock = std::scoped_lock{mutex_};
  return stats_unlocked();
}

template <typename Library>
ledger_info_t engine<Library>::info_unlocked() const {
  auto info = ledger_info_t{};
  info.record_count = records_.list_ids().size();
  info.event_count = events_.count();
  info.chain_head = events_.head();
  return info;
}

template <typename Library>
ledger_info_t engine<Library>::info() const {
  auto lock = std::scoped_lock{mutex_};
  return info_unlocked();
}

template <typename Library>
refuge::ledger::index_report_t engine<Library>::check_index() const {
  auto lock = std::scoped_lock{mutex_};
  return records_.check_index();
}

template <typename Library>
refuge::ledger::index_report_t engine<Library>::rebuild_index() {
  auto lock = std::scoped_lock{mutex_};
  return records_.rebuild_index();
}

template <typename Library>
std::optional<uint64_t> engine<Library>::verify_event_chain() const {
  auto lock = std::scoped_lock{mutex_};
  return events_.verify_chain();
}

template <typename Library>
bool engine<Library>::available() const {
  auto lock = std::scoped_lock{mutex_};
  return verifier_.available();
}

template <typename Library>
query_result_t engine<Library>::query(std::string_view path,
                                      const bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  spdlog::debug("Query {} ({} byte payload)", path, data.size());
  auto encoder = encoder_t{};

  auto decode_id = [&]() { return encoder.try_decode_exact<uint64_t>(data); };
  auto invalid_key = [&]() {
    return make_query_error(query_error_code::invalid_key, "invalid key", data);
  };

  if (path == "/records/ids") {
    return make_query_value(data, records_.list_ids());
  }
  if (path == "/records/get") {
    auto id = decode_id();
    return id ? make_query_optional(data, records_.get(*id)) : invalid_key();
  }
  if (path == "/records/list") {
    auto filter = data.empty()
                      ? std::optional<record_filter_t>{record_filter_t{}}
                      : encoder.try_decode_exact<record_filter_t>(data);
    return filter ? make_query_value(data, records_.list(*filter))
                  : invalid_key();
  }
  if (path == "/packages/get") {
    auto id = decode_id();
    return id ? make_query_optional(data, records_.get_package(*id))
              : invalid_key();
  }
  if (path == "/verifications/get") {
    auto id = decode_id();
    return id ? make_query_optional(data, verifier_.get_verification(*id))
              : invalid_key();
  }
  if (path == "/results/get") {
    auto id = decode_id();
    return id ? make_query_optional(data, verifier_.get_result(*id))
              : invalid_key();
  }
  if (path == "/events/range") {
    auto range = encoder.try_decode_exact<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return invalid_key();
    }
    return make_query_value(
        data, events_.list(std::get<0>(*range), std::get<1>(*range)));
  }
  if (path == "/ledger/stats") {
    return make_query_value(data, stats_unlocked());
  }
  if (path == "/ledger/info") {
    return make_query_value(data, info_unlocked());
  }
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported path", data);
}

template class engine<refuge::storage::rocksdb_storage_tag>;
template class engine<refuge::storage::memory_storage_tag>;

}  // namespace refuge::execution
