#include <refuge/ledger/scoring.hpp>

#include <algorithm>

namespace refuge::ledger {

uint32_t eligibility_score(std::string_view identity, std::string_view needs) {
  auto score = uint32_t{};
  if (identity.size() > 10) {
    score += 50;
  }
  if (needs.size() > 5) {
    score += 50;
  }
  return std::min<uint32_t>(score, 100);
}

uint32_t priority_score(std::string_view needs, std::string_view resources) {
  auto overlap = std::min(needs.size(), resources.size());
  auto matches = uint64_t{};
  for (auto i = size_t{}; i < overlap; ++i) {
    if (needs[i] == resources[i]) {
      ++matches;
    }
  }
  auto denominator = std::max<uint64_t>(1, needs.size());
  return static_cast<uint32_t>((100 * matches) / denominator);
}

scores_t default_scoring(
    const refuge::schema::eligibility_cleartexts_t& cleartexts) {
  return scores_t{
      .eligibility = eligibility_score(cleartexts.identity, cleartexts.needs),
      .priority = priority_score(cleartexts.needs, cleartexts.resources)};
}

}  // namespace refuge::ledger
