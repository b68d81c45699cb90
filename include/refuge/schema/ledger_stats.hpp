#pragma once

#include <refuge/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger stats.
// Aid workflow: Per-status record counts and the requested aid total for
// dashboards.
namespace refuge::schema {

template <uint16_t Version>
struct ledger_stats;

template <>
struct ledger_stats<1> final {
  uint16_t version{1};
  uint64_t total{};
  uint64_t pending{};
  uint64_t approved{};
  uint64_t distributed{};
  uint64_t rejected{};
  amount_t total_amount{};
  uint64_t packages{};
  uint64_t verifications{};
  uint64_t outstanding_requests{};
};

using ledger_stats_t = ledger_stats<1>;

}  // namespace refuge::schema
