#include <refuge/ledger/verification_engine.hpp>
#include <refuge/ledger/sequence.hpp>
#include <refuge/schema/cleartexts.hpp>
#include <refuge/schema/key/ledger_keys.hpp>
#include <refuge/storage/memory/storage.hpp>
#include <refuge/storage/rocksdb/storage.hpp>
#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

using namespace refuge::schema;

namespace refuge::ledger {

operation_result_t make_error_result(ledger_error_code code,
                                     std::string_view codespace,
                                     std::string info) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

operation_result_t make_callback_rejection(ledger_error_code code,
                                           request_id_t request_id,
                                           std::string_view reason) {
  spdlog::warn("Rejected callback for request {}: {} ({})", request_id,
               to_string(code), reason);
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{kCallbackRejectedLog};
  result.codespace = std::string{kCallbackCodespace};
  return result;
}

template <typename Library>
verification_engine<Library>::verification_engine(
    refuge::storage::storage<Library>& storage,
    record_store<Library>& records,
    correlation_table<Library>& correlations,
    event_log<Library>& events,
    oracle_t oracle)
    : storage_{storage},
      records_{records},
      correlations_{correlations},
      events_{events},
      oracle_{std::move(oracle)} {
  if (!oracle_.score) {
    oracle_.score = default_scoring;
  }
}

template <typename Library>
bool verification_engine<Library>::available() const {
  return static_cast<bool>(oracle_.submit) &&
         static_cast<bool>(oracle_.encrypt) &&
         static_cast<bool>(oracle_.verify_proof);
}

template <typename Library>
operation_result_t verification_engine<Library>::verify_eligibility(
    refuge::storage::write_batch& batch,
    record_id_t record_id,
    package_id_t package_id,
    timestamp_milliseconds_t now) {
  auto record = records_.get(batch, record_id);
  if (!record) {
    return make_error_result(ledger_error_code::not_found,
                             kVerificationCodespace, "record not found");
  }
  auto package = records_.get_package(package_id);
  if (!package) {
    return make_error_result(ledger_error_code::not_found,
                             kVerificationCodespace, "package not found");
  }
  if (!oracle_.submit) {
    return make_error_result(ledger_error_code::decryption_unavailable,
                             kVerificationCodespace);
  }

  auto request_id = oracle_.submit(std::vector{record->encrypted_identity,
                                               record->encrypted_needs,
                                               package->encrypted_resources});
  if (!request_id) {
    spdlog::error("Decryption submission failed for record {}", record_id);
    return make_error_result(ledger_error_code::decryption_unavailable,
                             kVerificationCodespace);
  }

  auto entry = pending_decryption_t{};
  entry.request_id = *request_id;
  entry.target_kind = target_kind_t::eligibility_computation;
  entry.target_id = record_id;
  entry.package_id = package_id;
  entry.submitted_at = now;
  auto code = correlations_.stage_register(batch, entry);
  if (code != ledger_error_code::ok) {
    return make_error_result(code, kVerificationCodespace);
  }

  auto result = operation_result_t{};
  result.id = *request_id;
  result.info = "eligibility computation requested";
  result.codespace = std::string{kVerificationCodespace};
  result.events.push_back(
      events_.stage(batch, ledger_event_type_t::verification_requested,
                    record_id, *request_id, now));
  return result;
}

template <typename Library>
std::optional<pending_decryption_t>
verification_engine<Library>::accept_callback(
    refuge::storage::write_batch& batch,
    target_kind_t kind,
    request_id_t request_id,
    const bytes_view_t& cleartexts,
    const bytes_view_t& proof,
    operation_result_t& result) {
  auto entry = correlations_.stage_resolve(batch, kind, request_id);
  if (!entry) {
    result = make_callback_rejection(ledger_error_code::unknown_request_id,
                                     request_id, to_string(kind));
    return std::nullopt;
  }
  if (!oracle_.verify_proof ||
      !oracle_.verify_proof(request_id, cleartexts, proof)) {
    result = make_callback_rejection(ledger_error_code::invalid_proof,
                                     request_id, "proof did not verify");
    return std::nullopt;
  }
  return entry;
}

template <typename Library>
std::optional<ciphertext_handle_t> verification_engine<Library>::encrypt_score(
    uint32_t score) {
  if (!oracle_.encrypt) {
    return std::nullopt;
  }
  auto plaintext = encoder_.encode(score);
  return oracle_.encrypt(make_bytes_view(plaintext));
}

template <typename Library>
operation_result_t verification_engine<Library>::perform_verification(
    refuge::storage::write_batch& batch,
    request_id_t request_id,
    const bytes_view_t& cleartexts,
    const bytes_view_t& proof,
    timestamp_milliseconds_t now) {
  auto result = operation_result_t{};
  auto entry =
      accept_callback(batch, target_kind_t::eligibility_computation,
                      request_id, cleartexts, proof, result);
  if (!entry) {
    return result;
  }
  auto inputs = encoder_.template try_decode_exact<eligibility_cleartexts_t>(
      cleartexts);
  if (!inputs) {
    return make_callback_rejection(ledger_error_code::malformed_cleartexts,
                                   request_id,
                                   "expected (identity, needs, resources)");
  }

  auto scores = oracle_.score(*inputs);
  auto encrypted_eligibility = encrypt_score(scores.eligibility);
  auto encrypted_priority = encrypt_score(scores.priority);
  if (!encrypted_eligibility || !encrypted_priority) {
    spdlog::error("Encryption of scores failed for request {}", request_id);
    return make_error_result(ledger_error_code::encryption_unavailable,
                             kCallbackCodespace);
  }

  auto verification = verification_t{};
  verification.id = stage_next_id(storage_, encoder_, batch,
                                  key::sequence_t::verification);
  verification.refugee_record_id = entry->target_id;
  verification.package_id = entry->package_id.value_or(0);
  verification.encrypted_eligibility = *encrypted_eligibility;
  verification.encrypted_priority = *encrypted_priority;
  verification.verified_at = now;

  // Scores stay encrypted here; revealed values come only from the proved
  // reveal callback.
  auto decrypted = decrypted_result_t{};
  decrypted.verification_id = verification.id;

  batch.put(key::make_verification_key(verification.id),
            encoder_.encode(verification));
  batch.put(key::make_result_key(verification.id), encoder_.encode(decrypted));

  result.id = verification.id;
  result.info = "verification completed";
  result.codespace = std::string{kCallbackCodespace};
  result.events.push_back(
      events_.stage(batch, ledger_event_type_t::verification_completed,
                    verification.id, request_id, now));
  return result;
}

template <typename Library>
operation_result_t verification_engine<Library>::request_verification_result(
    refuge::storage::write_batch& batch,
    verification_id_t verification_id,
    timestamp_milliseconds_t now) {
  auto verification = get_verification(verification_id);
  if (!verification) {
    return make_error_result(ledger_error_code::not_found,
                             kVerificationCodespace, "verification not found");
  }
  auto decrypted = get_result(verification_id);
  if (decrypted && decrypted->is_revealed) {
    return make_error_result(ledger_error_code::already_revealed,
                             kVerificationCodespace);
  }
  if (!oracle_.submit) {
    return make_error_result(ledger_error_code::decryption_unavailable,
                             kVerificationCodespace);
  }

  auto request_id = oracle_.submit(std::vector{
      verification->encrypted_eligibility, verification->encrypted_priority});
  if (!request_id) {
    spdlog::error("Decryption submission failed for verification {}",
                  verification_id);
    return make_error_result(ledger_error_code::decryption_unavailable,
                             kVerificationCodespace);
  }

  auto entry = pending_decryption_t{};
  entry.request_id = *request_id;
  entry.target_kind = target_kind_t::result_reveal;
  entry.target_id = verification_id;
  entry.submitted_at = now;
  auto code = correlations_.stage_register(batch, entry);
  if (code != ledger_error_code::ok) {
    return make_error_result(code, kVerificationCodespace);
  }

  auto result = operation_result_t{};
  result.id = *request_id;
  result.info = "result reveal requested";
  result.codespace = std::string{kVerificationCodespace};
  result.events.push_back(
      events_.stage(batch, ledger_event_type_t::reveal_requested,
                    verification_id, *request_id, now));
  return result;
}

template <typename Library>
operation_result_t verification_engine<Library>::decrypt_verification(
    refuge::storage::write_batch& batch,
    request_id_t request_id,
    const bytes_view_t& cleartexts,
    const bytes_view_t& proof,
    timestamp_milliseconds_t now) {
  auto result = operation_result_t{};
  auto entry = accept_callback(batch, target_kind_t::result_reveal,
                               request_id, cleartexts, proof, result);
  if (!entry) {
    return result;
  }
  auto scores =
      encoder_.template try_decode_exact<reveal_cleartexts_t>(cleartexts);
  if (!scores) {
    return make_callback_rejection(ledger_error_code::malformed_cleartexts,
                                   request_id, "expected (eligibility, priority)");
  }

  auto result_key = key::make_result_key(entry->target_id);
  auto decrypted = storage_.template get<decrypted_result_t>(
      encoder_, batch, make_bytes_view(result_key));
  if (!decrypted) {
    return make_callback_rejection(ledger_error_code::not_found, request_id,
                                   "verification result missing");
  }

  result.id = entry->target_id;
  result.codespace = std::string{kCallbackCodespace};
  if (decrypted->is_revealed) {
    spdlog::info("Verification {} already revealed; request {} consumed",
                 entry->target_id, request_id);
    result.info = std::string{to_string(ledger_error_code::already_revealed)};
    return result;
  }

  decrypted->eligibility = scores->eligibility;
  decrypted->priority = scores->priority;
  decrypted->is_revealed = true;
  decrypted->revealed_at = now;
  batch.put(std::move(result_key), encoder_.encode(*decrypted));

  result.info = "result revealed";
  result.events.push_back(
      events_.stage(batch, ledger_event_type_t::result_revealed,
                    entry->target_id, request_id, now));
  return result;
}

template <typename Library>
std::optional<verification_t> verification_engine<Library>::get_verification(
    verification_id_t id) const {
  auto key = key::make_verification_key(id);
  return storage_.template get<verification_t>(encoder_, make_bytes_view(key));
}

template <typename Library>
std::optional<decrypted_result_t> verification_engine<Library>::get_result(
    verification_id_t id) const {
  auto key = key::make_result_key(id);
  return storage_.template get<decrypted_result_t>(encoder_,
                                                   make_bytes_view(key));
}

template <typename Library>
uint64_t verification_engine<Library>::verification_count() const {
  auto prefix = key::make_prefix_key(key::kVerificationKeyPrefix);
  return storage_.list_by_prefix(make_bytes_view(prefix)).size();
}

template class verification_engine<refuge::storage::rocksdb_storage_tag>;
template class verification_engine<refuge::storage::memory_storage_tag>;

}  // namespace refuge::ledger
