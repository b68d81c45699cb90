#pragma once
#include <refuge/schema/primitives.hpp>
#include <functional>
#include <optional>
#include <vector>

// Capabilities the ledger is handed at construction. The encryption and
// decryption services live outside the process; the ledger only ever sees
// opaque handles going out and (cleartexts, proof) coming back.
namespace refuge::oracle {

/// Turn a plaintext value into a ciphertext handle. std::nullopt means the
/// encryption service could not be reached.
using encryptor_t =
    std::function<std::optional<refuge::schema::ciphertext_handle_t>(
        const refuge::schema::bytes_view_t& plaintext)>;

/// Submit handles for asynchronous decryption. Returns the request id the
/// service will echo on its callback, or std::nullopt when submission failed.
/// Implementations must not call back into the ledger on this thread.
using decryption_submitter_t =
    std::function<std::optional<refuge::schema::request_id_t>(
        const std::vector<refuge::schema::ciphertext_handle_t>& handles)>;

/// Check that `proof` attests `cleartexts` as the decryption of request_id.
using proof_verifier_t =
    std::function<bool(refuge::schema::request_id_t request_id,
                       const refuge::schema::bytes_view_t& cleartexts,
                       const refuge::schema::bytes_view_t& proof)>;

}  // namespace refuge::oracle
