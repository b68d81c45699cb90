#pragma once

#include <openssl/evp.h>
#include <refuge/blake3/hash.hpp>
#include <refuge/crypto/decryption_proof.hpp>
#include <refuge/oracle/capabilities.hpp>
#include <refuge/schema/cleartexts.hpp>
#include <refuge/schema/encoding/scale/encoder.hpp>
#include <refuge/schema/primitives.hpp>
#include <refuge/testing/common.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace refuge::testing {

/// In-process stand-in for the external encryption and decryption service.
///
/// "Encryption" records the plaintext under a fresh handle. Submissions are
/// queued with sequential request ids, and callbacks are produced on demand
/// with an Ed25519 signature over the proof message.
class decryption_authority final {
 public:
  decryption_authority() : key_{nullptr, EVP_PKEY_free} {
    auto ctx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto* raw = static_cast<EVP_PKEY*>(nullptr);
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
        EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
      throw std::runtime_error{"ed25519 keygen failed"};
    }
    key_.reset(raw);

    auto size = signer_.public_key.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), signer_.public_key.data(),
                                    &size) != 1) {
      throw std::runtime_error{"ed25519 public key export failed"};
    }
  }

  decryption_authority(const decryption_authority&) = delete;
  decryption_authority& operator=(const decryption_authority&) = delete;

  refuge::schema::signer_id_t signer() const { return signer_; }

  refuge::schema::ciphertext_handle_t encrypt(
      const refuge::schema::bytes_view_t& plaintext) {
    auto lock = std::scoped_lock{mutex_};
    auto handle = refuge::blake3::hash(
        refuge::schema::make_bytes_view(encoder_.encode(next_handle_++)),
        plaintext);
    plaintexts_[handle] = refuge::schema::make_bytes(plaintext);
    return handle;
  }

  refuge::schema::ciphertext_handle_t encrypt(const std::string& plaintext) {
    return encrypt(refuge::schema::make_bytes_view(plaintext));
  }

  std::optional<refuge::schema::request_id_t> submit(
      const std::vector<refuge::schema::ciphertext_handle_t>& handles) {
    auto lock = std::scoped_lock{mutex_};
    if (offline_) {
      return std::nullopt;
    }
    auto request_id = next_request_id_++;
    if (repeat_request_id_) {
      request_id = *repeat_request_id_;
    }
    submissions_[request_id] = handles;
    return request_id;
  }

  /// Make the service unreachable for both encryption and submission.
  void set_offline(bool offline) {
    auto lock = std::scoped_lock{mutex_};
    offline_ = offline;
  }

  /// Hand out `request_id` for every following submission.
  void repeat_request_id(refuge::schema::request_id_t request_id) {
    auto lock = std::scoped_lock{mutex_};
    repeat_request_id_ = request_id;
  }

  refuge::schema::bytes_t plaintext(
      const refuge::schema::ciphertext_handle_t& handle) const {
    auto lock = std::scoped_lock{mutex_};
    return plaintexts_.at(handle);
  }

  std::vector<refuge::schema::ciphertext_handle_t> submission(
      refuge::schema::request_id_t request_id) const {
    auto lock = std::scoped_lock{mutex_};
    return submissions_.at(request_id);
  }

  /// Cleartexts for an eligibility request: (identity, needs, resources).
  refuge::schema::bytes_t eligibility_cleartexts(
      refuge::schema::request_id_t request_id) {
    auto handles = submission(request_id);
    auto cleartexts = refuge::schema::eligibility_cleartexts_t{
        .identity = refuge::schema::make_string(plaintext(handles.at(0))),
        .needs = refuge::schema::make_string(plaintext(handles.at(1))),
        .resources = refuge::schema::make_string(plaintext(handles.at(2)))};
    auto lock = std::scoped_lock{mutex_};
    return encoder_.encode(cleartexts);
  }

  /// Cleartexts for a reveal request: (eligibility, priority).
  refuge::schema::bytes_t reveal_cleartexts(
      refuge::schema::request_id_t request_id) {
    auto handles = submission(request_id);
    auto eligibility = plaintext(handles.at(0));
    auto priority = plaintext(handles.at(1));
    auto lock = std::scoped_lock{mutex_};
    auto cleartexts = refuge::schema::reveal_cleartexts_t{
        .eligibility = encoder_.decode<uint32_t>(
            refuge::schema::make_bytes_view(eligibility)),
        .priority = encoder_.decode<uint32_t>(
            refuge::schema::make_bytes_view(priority))};
    return encoder_.encode(cleartexts);
  }

  refuge::schema::bytes_t sign(refuge::schema::request_id_t request_id,
                               const refuge::schema::bytes_t& cleartexts) const {
    auto message = refuge::crypto::make_decryption_proof_message(
        request_id, refuge::schema::make_bytes_view(cleartexts));
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
        EVP_MD_CTX_new(), EVP_MD_CTX_free};
    auto proof = refuge::schema::bytes_t(64);
    auto size = proof.size();
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
            1 ||
        EVP_DigestSign(ctx.get(), proof.data(), &size, message.data(),
                       message.size()) != 1) {
      throw std::runtime_error{"ed25519 signing failed"};
    }
    return proof;
  }

  refuge::oracle::encryptor_t encryptor() {
    return [this](const refuge::schema::bytes_view_t& plaintext)
               -> std::optional<refuge::schema::ciphertext_handle_t> {
      {
        auto lock = std::scoped_lock{mutex_};
        if (offline_) {
          return std::nullopt;
        }
      }
      return encrypt(plaintext);
    };
  }

  refuge::oracle::decryption_submitter_t submitter() {
    return [this](const std::vector<refuge::schema::ciphertext_handle_t>&
                      handles) { return submit(handles); };
  }

  refuge::oracle::proof_verifier_t verifier() const {
    return refuge::crypto::make_proof_verifier(signer_);
  }

 private:
  mutable std::mutex mutex_;
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
  refuge::schema::ed25519_signer_id signer_{};
  scale_encoder_t encoder_;
  uint64_t next_handle_{1};
  refuge::schema::request_id_t next_request_id_{1000};
  std::optional<refuge::schema::request_id_t> repeat_request_id_;
  bool offline_{false};
  std::map<refuge::schema::ciphertext_handle_t, refuge::schema::bytes_t>
      plaintexts_;
  std::map<refuge::schema::request_id_t,
           std::vector<refuge::schema::ciphertext_handle_t>>
      submissions_;
};

}  // namespace refuge::testing
