#include "gtest/gtest.h"

#include <stdexcept>

#include "lhr/arc_scores.h"

namespace lhrtree {

TEST(ArcScoresTest, TestSortedHeads) {
  std::vector<ScoredHeads> heads = {{}, {ScoredHead(0, 0.8)},
                                    {ScoredHead(0, 0.6), ScoredHead(1, 0.7)}};
  ArcScores scores(heads, {0.9, 0.1, 0.05});

  EXPECT_EQ(3u, scores.size());
  ASSERT_EQ(1u, scores.sorted_heads(0).size());
  EXPECT_EQ(kRootId, scores.sorted_heads(0)[0].governor);

  const ScoredHeads& sorted = scores.sorted_heads(2);
  ASSERT_EQ(3u, sorted.size());
  EXPECT_EQ(1, sorted[0].governor);
  EXPECT_EQ(0, sorted[1].governor);
  EXPECT_EQ(kRootId, sorted[2].governor);
  EXPECT_DOUBLE_EQ(0.05, scores.root_score(2));
}

TEST(ArcScoresTest, TestTiesByGovernor) {
  std::vector<ScoredHeads> heads = {{ScoredHead(2, 0.5), ScoredHead(1, 0.5)},
                                    {}, {}};
  ArcScores scores(heads, {0.5, 0.2, 0.2});

  const ScoredHeads& sorted = scores.sorted_heads(0);
  EXPECT_EQ(kRootId, sorted[0].governor);
  EXPECT_EQ(1, sorted[1].governor);
  EXPECT_EQ(2, sorted[2].governor);
}

TEST(ArcScoresTest, TestHighestScoringHead) {
  std::vector<ScoredHeads> heads = {{ScoredHead(1, 0.3), ScoredHead(2, 0.2)},
                                    {}, {}};
  ArcScores scores(heads, {0.6, 0.9, 0.1});

  boost::optional<ScoredHead> head = scores.highest_scoring_head(0, {});
  ASSERT_TRUE(head);
  EXPECT_EQ(kRootId, head->governor);

  head = scores.highest_scoring_head(0, {kRootId});
  ASSERT_TRUE(head);
  EXPECT_EQ(1, head->governor);
  EXPECT_DOUBLE_EQ(0.3, head->score);

  head = scores.highest_scoring_head(0, {kRootId, 1});
  ASSERT_TRUE(head);
  EXPECT_EQ(2, head->governor);

  EXPECT_FALSE(scores.highest_scoring_head(0, {kRootId, 1, 2}));
  EXPECT_FALSE(scores.highest_scoring_head(1, {kRootId}));
}

TEST(ArcScoresTest, TestHighestScoringTop) {
  ArcScores scores({{}, {}, {}}, {0.4, 0.7, 0.7});
  std::pair<WordIndex, Real> top = scores.highest_scoring_top();
  EXPECT_EQ(1, top.first);
  EXPECT_DOUBLE_EQ(0.7, top.second);
}

TEST(ArcScoresTest, TestInvalidScores) {
  EXPECT_THROW(ArcScores({}, {}), std::invalid_argument);
  EXPECT_THROW(ArcScores({{}, {}}, {0.5}), std::invalid_argument);
  EXPECT_THROW(ArcScores({{ScoredHead(0, 0.5)}, {}}, {0.1, 0.1}),
               std::invalid_argument);
  EXPECT_THROW(ArcScores({{ScoredHead(2, 0.5)}, {}}, {0.1, 0.1}),
               std::invalid_argument);
  EXPECT_THROW(
      ArcScores({{ScoredHead(1, 0.5), ScoredHead(1, 0.4)}, {}}, {0.1, 0.1}),
      std::invalid_argument);
}

}  // namespace lhrtree
