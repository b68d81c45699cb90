#pragma once

#include <refuge/schema/ledger_event_type.hpp>
#include <refuge/schema/primitives.hpp>
#include <optional>

// Schema type: ledger event.
// Aid workflow: Hash-chained audit row. `hash` covers `previous_hash` and
// every other field, so a monitor can detect gaps or rewrites.
namespace refuge::schema {

template <uint16_t Version>
struct ledger_event;

template <>
struct ledger_event<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  ledger_event_type_t type{};
  uint64_t entity_id{};
  std::optional<request_id_t> request_id;
  timestamp_milliseconds_t recorded_at{};
  hash32_t previous_hash{};
  hash32_t hash{};
};

using ledger_event_t = ledger_event<1>;

}  // namespace refuge::schema
