#pragma once
#include <refuge/schema/encoding/scale/encoder.hpp>
#include <refuge/schema/ledger_event.hpp>
#include <refuge/storage/storage.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace refuge::ledger {

/// Receives events after the batch that recorded them has committed.
using event_sink_t = std::function<void(const refuge::schema::ledger_event_t&)>;

/// Hash that chains `event` to its predecessor:
/// blake3(previous_hash || SCALE(event fields other than the hashes)).
refuge::schema::hash32_t chain_hash(const refuge::schema::ledger_event_t& event);

/// Append-only audit stream. Events are staged into the same batch as the
/// state change they describe.
template <typename Library>
class event_log final {
 public:
  explicit event_log(refuge::storage::storage<Library>& storage);

  refuge::schema::ledger_event_t stage(
      refuge::storage::write_batch& batch,
      refuge::schema::ledger_event_type_t type,
      uint64_t entity_id,
      std::optional<refuge::schema::request_id_t> request_id,
      refuge::schema::timestamp_milliseconds_t now);

  /// Events with ids in [from, to].
  std::vector<refuge::schema::ledger_event_t> list(uint64_t from,
                                                   uint64_t to) const;

  uint64_t count() const;

  /// Hash of the newest event, zero when the log is empty.
  refuge::schema::hash32_t head() const;

  /// Id of the first event whose hash or back-link does not check out.
  std::optional<uint64_t> verify_chain() const;

 private:
  refuge::storage::storage<Library>& storage_;
  mutable refuge::schema::encoding::encoder<
      refuge::schema::encoding::scale_encoder_tag>
      encoder_;
};

}  // namespace refuge::ledger
