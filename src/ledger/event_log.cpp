#include <refuge/blake3/hash.hpp>
#include <refuge/ledger/event_log.hpp>
#include <refuge/ledger/sequence.hpp>
#include <refuge/schema/key/ledger_keys.hpp>
#include <refuge/storage/memory/storage.hpp>
#include <refuge/storage/rocksdb/storage.hpp>
#include <spdlog/spdlog.h>

#include <limits>
#include <tuple>

using namespace refuge::schema;

namespace refuge::ledger {

hash32_t chain_hash(const ledger_event_t& event) {
  auto encoder =
      encoding::encoder<encoding::scale_encoder_tag>{};
  auto body = encoder.encode(std::tuple{event.version, event.event_id,
                                        event.type, event.entity_id,
                                        event.request_id, event.recorded_at});
  return refuge::blake3::hash(
      bytes_view_t{event.previous_hash.data(), event.previous_hash.size()},
      make_bytes_view(body));
}

template <typename Library>
event_log<Library>::event_log(refuge::storage::storage<Library>& storage)
    : storage_{storage} {}

template <typename Library>
ledger_event_t event_log<Library>::stage(
    refuge::storage::write_batch& batch,
    ledger_event_type_t type,
    uint64_t entity_id,
    std::optional<request_id_t> request_id,
    timestamp_milliseconds_t now) {
  auto head_key = key::make_event_head_key();
  auto event = ledger_event_t{};
  event.event_id =
      stage_next_id(storage_, encoder_, batch, key::sequence_t::event);
  event.type = type;
  event.entity_id = entity_id;
  event.request_id = request_id;
  event.recorded_at = now;
  event.previous_hash =
      storage_
          .template get<hash32_t>(encoder_, batch, make_bytes_view(head_key))
          .value_or(make_zero_hash());
  event.hash = chain_hash(event);

  batch.put(key::make_event_key(event.event_id), encoder_.encode(event));
  batch.put(std::move(head_key), encoder_.encode(event.hash));
  spdlog::debug("Staged event {} {} for entity {}", event.event_id,
                to_string(type), entity_id);
  return event;
}

template <typename Library>
std::vector<ledger_event_t> event_log<Library>::list(uint64_t from,
                                                     uint64_t to) const {
  auto events = std::vector<ledger_event_t>{};
  if (from > to) {
    return events;
  }
  auto prefix = key::make_prefix_key(key::kEventPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto id = key::parse_u64_suffix(make_bytes_view(row_key), key::kEventPrefix);
    if (!id || *id < from) {
      continue;
    }
    if (*id > to) {
      break;
    }
    events.push_back(
        encoder_.template decode<ledger_event_t>(make_bytes_view(value)));
  }
  return events;
}

template <typename Library>
uint64_t event_log<Library>::count() const {
  return last_id(storage_, encoder_, refuge::storage::write_batch{},
                 key::sequence_t::event);
}

template <typename Library>
hash32_t event_log<Library>::head() const {
  auto head_key = key::make_event_head_key();
  return storage_.template get<hash32_t>(encoder_, make_bytes_view(head_key))
      .value_or(make_zero_hash());
}

template <typename Library>
std::optional<uint64_t> event_log<Library>::verify_chain() const {
  auto previous = make_zero_hash();
  auto expected_id = uint64_t{1};
  for (const auto& event : list(1, std::numeric_limits<uint64_t>::max())) {
    if (event.event_id != expected_id || event.previous_hash != previous ||
        event.hash != chain_hash(event)) {
      return event.event_id;
    }
    previous = event.hash;
    ++expected_id;
  }
  if (previous != head()) {
    return expected_id;
  }
  return std::nullopt;
}

template class event_log<refuge::storage::rocksdb_storage_tag>;
template class event_log<refuge::storage::memory_storage_tag>;

}  // namespace refuge::ledger
