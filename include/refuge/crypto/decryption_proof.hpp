#pragma once

#include <refuge/oracle/capabilities.hpp>
#include <refuge/schema/primitives.hpp>
#include <optional>
#include <string_view>

namespace refuge::crypto {

inline constexpr std::string_view kDecryptionProofDomain{
    "refuge.decryption.v1"};

/// Bytes the decryption authority signs for one callback:
/// SCALE(domain, request_id, cleartexts).
refuge::schema::bytes_t make_decryption_proof_message(
    refuge::schema::request_id_t request_id,
    const refuge::schema::bytes_view_t& cleartexts);

/// Interpret a proof blob as a signature. 64 bytes is Ed25519, 65 bytes is
/// compact secp256k1; any other length is rejected.
std::optional<refuge::schema::signature_t> try_make_signature(
    const refuge::schema::bytes_view_t& proof);

bool verify_decryption_proof(const refuge::schema::signer_id_t& authority,
                             refuge::schema::request_id_t request_id,
                             const refuge::schema::bytes_view_t& cleartexts,
                             const refuge::schema::bytes_view_t& proof);

/// Proof verifier bound to a single decryption authority key.
refuge::oracle::proof_verifier_t make_proof_verifier(
    refuge::schema::signer_id_t authority);

}  // namespace refuge::crypto
