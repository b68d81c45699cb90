#include <refuge/crypto/decryption_proof.hpp>
#include <refuge/crypto/verify.hpp>
#include <refuge/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <string>
#include <tuple>

namespace refuge::crypto {

namespace {

using encoder_t = refuge::schema::encoding::encoder<
    refuge::schema::encoding::scale_encoder_tag>;

template <typename Signature>
Signature copy_signature(const refuge::schema::bytes_view_t& proof) {
  auto signature = Signature{};
  std::copy_n(proof.data(), signature.size(), signature.data());
  return signature;
}

}  // namespace

refuge::schema::bytes_t make_decryption_proof_message(
    refuge::schema::request_id_t request_id,
    const refuge::schema::bytes_view_t& cleartexts) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{std::string{kDecryptionProofDomain}, request_id,
                                   refuge::schema::make_bytes(cleartexts)});
}

std::optional<refuge::schema::signature_t> try_make_signature(
    const refuge::schema::bytes_view_t& proof) {
  if (proof.size() == std::tuple_size_v<refuge::schema::ed25519_signature_t>) {
    return copy_signature<refuge::schema::ed25519_signature_t>(proof);
  }
  if (proof.size() ==
      std::tuple_size_v<refuge::schema::secp256k1_signature_t>) {
    return copy_signature<refuge::schema::secp256k1_signature_t>(proof);
  }
  return std::nullopt;
}

bool verify_decryption_proof(const refuge::schema::signer_id_t& authority,
                             refuge::schema::request_id_t request_id,
                             const refuge::schema::bytes_view_t& cleartexts,
                             const refuge::schema::bytes_view_t& proof) {
  auto signature = try_make_signature(proof);
  if (!signature) {
    return false;
  }
  auto message = make_decryption_proof_message(request_id, cleartexts);
  return verify_signature(
      refuge::schema::bytes_view_t{message.data(), message.size()}, authority,
      *signature);
}

refuge::oracle::proof_verifier_t make_proof_verifier(
    refuge::schema::signer_id_t authority) {
  return [authority = std::move(authority)](
             refuge::schema::request_id_t request_id,
             const refuge::schema::bytes_view_t& cleartexts,
             const refuge::schema::bytes_view_t& proof) {
    return verify_decryption_proof(authority, request_id, cleartexts, proof);
  };
}

}  // namespace refuge::crypto
