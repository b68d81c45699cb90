#include <gtest/gtest.h>
#include <refuge/ledger/scoring.hpp>

TEST(scoring, eligibility_awards_fifty_per_long_field) {
  EXPECT_EQ(refuge::ledger::eligibility_score("refugee-id1", "water!"), 100u);
  EXPECT_EQ(refuge::ledger::eligibility_score("short", "water!"), 50u);
  EXPECT_EQ(refuge::ledger::eligibility_score("refugee-id1", "food"), 50u);
  EXPECT_EQ(refuge::ledger::eligibility_score("", ""), 0u);
}

TEST(scoring, eligibility_thresholds_are_strict) {
  EXPECT_EQ(refuge::ledger::eligibility_score("0123456789", "12345"), 0u);
}

TEST(scoring, priority_counts_positional_matches) {
  EXPECT_EQ(refuge::ledger::priority_score("abcde", "abxde"), 80u);
  EXPECT_EQ(refuge::ledger::priority_score("food,water", "food,water"), 100u);
  EXPECT_EQ(refuge::ledger::priority_score("abc", "xyz"), 0u);
}

TEST(scoring, priority_truncates_and_handles_uneven_lengths) {
  EXPECT_EQ(refuge::ledger::priority_score("abc", "a"), 33u);
  EXPECT_EQ(refuge::ledger::priority_score("ab", "abcdef"), 100u);
  EXPECT_EQ(refuge::ledger::priority_score("", "anything"), 0u);
}

TEST(scoring, default_scoring_is_deterministic) {
  auto inputs = refuge::schema::eligibility_cleartexts_t{
      .identity = "refugee-id-001", .needs = "food,water",
      .resources = "food,water"};
  auto first = refuge::ledger::default_scoring(inputs);
  EXPECT_EQ(first, (refuge::ledger::scores_t{.eligibility = 100,
                                             .priority = 100}));
  EXPECT_EQ(refuge::ledger::default_scoring(inputs), first);
}
