#pragma once

#include <refuge/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger info.
// Aid workflow: Summary served on /ledger/info: record count, event count and
// the current event chain head.
namespace refuge::schema {

template <uint16_t Version>
struct ledger_info;

template <>
struct ledger_info<1> final {
  uint16_t version{1};
  uint64_t record_count{};
  uint64_t event_count{};
  hash32_t chain_head{};
};

using ledger_info_t = ledger_info<1>;

}  // namespace refuge::schema
