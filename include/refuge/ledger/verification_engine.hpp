#pragma once
#include <refuge/ledger/correlation_table.hpp>
#include <refuge/ledger/event_log.hpp>
#include <refuge/ledger/record_store.hpp>
#include <refuge/ledger/scoring.hpp>
#include <refuge/oracle/capabilities.hpp>
#include <refuge/schema/decrypted_result.hpp>
#include <refuge/schema/encoding/scale/encoder.hpp>
#include <refuge/schema/operation_result.hpp>
#include <refuge/schema/verification.hpp>
#include <refuge/storage/storage.hpp>
#include <optional>
#include <string_view>

namespace refuge::ledger {

inline constexpr std::string_view kVerificationCodespace{
    "refuge.verification"};
inline constexpr std::string_view kCallbackCodespace{"refuge.callback"};
inline constexpr std::string_view kCallbackRejectedLog{"callback rejected"};

/// Capabilities used by the verification protocol.
struct oracle_t final {
  refuge::oracle::decryption_submitter_t submit;
  refuge::oracle::encryptor_t encrypt;
  refuge::oracle::proof_verifier_t verify_proof;
  scoring_function_t score{default_scoring};
};

/// Two-phase confidential verification.
///
/// Phase 1 submits a record's identity and needs together with a package's
/// resources for decryption and waits for `perform_verification`, which
/// scores the cleartexts and stores both scores re-encrypted. Phase 2 submits
/// those score handles and waits for `decrypt_verification`, which reveals
/// the result once.
///
/// Every member stages into the caller's batch and reports the outcome; the
/// caller commits only when the result succeeded, so a failed call leaves
/// storage untouched.
template <typename Library>
class verification_engine final {
 public:
  verification_engine(refuge::storage::storage<Library>& storage,
                      record_store<Library>& records,
                      correlation_table<Library>& correlations,
                      event_log<Library>& events,
                      oracle_t oracle);

  refuge::schema::operation_result_t verify_eligibility(
      refuge::storage::write_batch& batch,
      refuge::schema::record_id_t record_id,
      refuge::schema::package_id_t package_id,
      refuge::schema::timestamp_milliseconds_t now);

  refuge::schema::operation_result_t perform_verification(
      refuge::storage::write_batch& batch,
      refuge::schema::request_id_t request_id,
      const refuge::schema::bytes_view_t& cleartexts,
      const refuge::schema::bytes_view_t& proof,
      refuge::schema::timestamp_milliseconds_t now);

  refuge::schema::operation_result_t request_verification_result(
      refuge::storage::write_batch& batch,
      refuge::schema::verification_id_t verification_id,
      refuge::schema::timestamp_milliseconds_t now);

  refuge::schema::operation_result_t decrypt_verification(
      refuge::storage::write_batch& batch,
      refuge::schema::request_id_t request_id,
      const refuge::schema::bytes_view_t& cleartexts,
      const refuge::schema::bytes_view_t& proof,
      refuge::schema::timestamp_milliseconds_t now);

  std::optional<refuge::schema::verification_t> get_verification(
      refuge::schema::verification_id_t id) const;

  std::optional<refuge::schema::decrypted_result_t> get_result(
      refuge::schema::verification_id_t id) const;

  uint64_t verification_count() const;

  /// True when every capability the protocol needs was supplied.
  bool available() const;

 private:
  /// Resolve the entry and check the proof. On failure `result` carries the
  /// rejection and std::nullopt is returned.
  std::optional<refuge::schema::pending_decryption_t> accept_callback(
      refuge::storage::write_batch& batch,
      refuge::schema::target_kind_t kind,
      refuge::schema::request_id_t request_id,
      const refuge::schema::bytes_view_t& cleartexts,
      const refuge::schema::bytes_view_t& proof,
      refuge::schema::operation_result_t& result);

  std::optional<refuge::schema::ciphertext_handle_t> encrypt_score(
      uint32_t score);

  refuge::storage::storage<Library>& storage_;
  record_store<Library>& records_;
  correlation_table<Library>& correlations_;
  event_log<Library>& events_;
  oracle_t oracle_;
  mutable refuge::schema::encoding::encoder<
      refuge::schema::encoding::scale_encoder_tag>
      encoder_;
};

/// Error envelope with the code's own text as log.
refuge::schema::operation_result_t make_error_result(
    refuge::schema::ledger_error_code code,
    std::string_view codespace,
    std::string info = {});

/// Error envelope shared by every rejected callback. The reason is logged
/// server-side only.
refuge::schema::operation_result_t make_callback_rejection(
    refuge::schema::ledger_error_code code,
    refuge::schema::request_id_t request_id,
    std::string_view reason);

}  // namespace refuge::ledger
