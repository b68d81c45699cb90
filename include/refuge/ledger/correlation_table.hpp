#pragma once
#include <refuge/schema/encoding/scale/encoder.hpp>
#include <refuge/schema/ledger_error_code.hpp>
#include <refuge/schema/pending_decryption.hpp>
#include <refuge/schema/target_kind.hpp>
#include <refuge/storage/storage.hpp>
#include <optional>
#include <vector>

namespace refuge::ledger {

/// Outstanding decryption requests, keyed by (target kind, request id).
///
/// An entry is written when a request is submitted and erased by the one
/// callback that consumes it, so a replayed request id is unknown by then.
/// The two target kinds live in disjoint keyspaces: a callback can only
/// resolve entries of its own kind.
template <typename Library>
class correlation_table final {
 public:
  explicit correlation_table(refuge::storage::storage<Library>& storage);

  /// Returns duplicate_request_id when the id is already outstanding for the
  /// entry's kind.
  refuge::schema::ledger_error_code stage_register(
      refuge::storage::write_batch& batch,
      const refuge::schema::pending_decryption_t& entry);

  /// Look up and stage removal of an entry. std::nullopt means the id was
  /// never issued for `kind` or was already consumed.
  std::optional<refuge::schema::pending_decryption_t> stage_resolve(
      refuge::storage::write_batch& batch,
      refuge::schema::target_kind_t kind,
      refuge::schema::request_id_t request_id);

  std::optional<refuge::schema::pending_decryption_t> find(
      refuge::schema::target_kind_t kind,
      refuge::schema::request_id_t request_id) const;

  /// Every open entry, eligibility computations first, each in request id
  /// order.
  std::vector<refuge::schema::pending_decryption_t> outstanding() const;

 private:
  refuge::storage::storage<Library>& storage_;
  mutable refuge::schema::encoding::encoder<
      refuge::schema::encoding::scale_encoder_tag>
      encoder_;
};

}  // namespace refuge::ledger
