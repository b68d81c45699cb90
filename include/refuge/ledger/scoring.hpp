#pragma once
#include <refuge/schema/cleartexts.hpp>
#include <cstdint>
#include <functional>
#include <string_view>

namespace refuge::ledger {

struct scores_t final {
  uint32_t eligibility{};
  uint32_t priority{};

  friend bool operator==(const scores_t&, const scores_t&) = default;
};

/// Maps decrypted inputs to (eligibility, priority). Must be deterministic.
using scoring_function_t =
    std::function<scores_t(const refuge::schema::eligibility_cleartexts_t&)>;

/// 50 points for an identity longer than 10 bytes, 50 for needs longer than
/// 5 bytes, capped at 100.
uint32_t eligibility_score(std::string_view identity, std::string_view needs);

/// Percentage of needs positions matched byte-for-byte by resources,
/// truncated.
uint32_t priority_score(std::string_view needs, std::string_view resources);

scores_t default_scoring(
    const refuge::schema::eligibility_cleartexts_t& cleartexts);

}  // namespace refuge::ledger
