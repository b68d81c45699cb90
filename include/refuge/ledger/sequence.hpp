#pragma once
#include <refuge/schema/key/ledger_keys.hpp>
#include <refuge/storage/storage.hpp>
#include <cstdint>

namespace refuge::ledger {

/// Last id handed out by `sequence`, or 0 when nothing was ever allocated.
/// Reads through `batch` so several allocations within one call chain.
template <typename Storage, typename Encoder>
uint64_t last_id(const Storage& storage,
                 Encoder& encoder,
                 const refuge::storage::write_batch& batch,
                 refuge::schema::key::sequence_t sequence) {
  auto key = refuge::schema::key::make_sequence_key(sequence);
  return storage
      .template get<uint64_t>(encoder, batch,
                              refuge::schema::make_bytes_view(key))
      .value_or(0);
}

/// Stage the next id of `sequence` into `batch` and return it. Ids start at 1;
/// a batch that is never committed leaves the sequence where it was.
template <typename Storage, typename Encoder>
uint64_t stage_next_id(const Storage& storage,
                       Encoder& encoder,
                       refuge::storage::write_batch& batch,
                       refuge::schema::key::sequence_t sequence) {
  auto next = last_id(storage, encoder, batch, sequence) + 1;
  batch.put(refuge::schema::key::make_sequence_key(sequence),
            encoder.encode(next));
  return next;
}

}  // namespace refuge::ledger
