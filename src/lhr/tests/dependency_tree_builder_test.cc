#include "gtest/gtest.h"

#include <stdexcept>

#include "lhr/dependency_tree_builder.h"

namespace lhrtree {

// Counts the predictions asked to a static labeler.
class CountingDeprelLabeler : public DeprelLabeler {
 public:
  explicit CountingDeprelLabeler(const ScoredDeprelsList& scores)
      : labeler_(scores), calls_(0) {}

  ScoredDeprelsList predict(const DependencyTree& tree) const override {
    ++calls_;
    return labeler_.predict(tree);
  }

  int calls() const { return calls_; }

 private:
  StaticDeprelLabeler labeler_;
  mutable int calls_;
};

class DependencyTreeBuilderTest : public testing::Test {
 protected:
  void SetUp() override {
    config = boost::make_shared<ModelConfig>();
    dict = boost::make_shared<Dict>();
    pos_y = dict->convertTag("Y", false);
    label_x = dict->convertLabel("X", false);
    label_w = dict->convertLabel("W", false);
  }

  boost::shared_ptr<ModelConfig> config;
  boost::shared_ptr<Dict> dict;
  WordId pos_y, label_x, label_w;
};

TEST_F(DependencyTreeBuilderTest, TestBeamTree) {
  ParsingSentence sentence({1, 2, 3}, {{}, {}, {}}, 1);
  std::vector<ScoredHeads> heads = {{},
                                    {ScoredHead(0, 0.8)},
                                    {ScoredHead(1, 0.7), ScoredHead(0, 0.6)}};
  ArcScores scores(heads, {0.9, 0.1, 0.05});

  DependencyTreeBuilder builder(sentence, scores, config);
  boost::optional<DependencyTree> tree = builder.build();

  ASSERT_TRUE(tree);
  EXPECT_EQ(BuildOutcome::beam, builder.outcome());
  EXPECT_EQ(Indices({kRootId, 0, 1}), tree->arcs());
  EXPECT_NEAR(2.4, tree->score(), 1e-9);
  EXPECT_GE(builder.num_states(), 1);

  DependencyTree greedy = builder.buildGreedyTree();
  EXPECT_TRUE(greedy.equal_arcs(*tree));
}

TEST_F(DependencyTreeBuilderTest, TestRepairedTree) {
  ParsingSentence sentence({1, 2, 3}, {{}, {}, {}}, 1);
  std::vector<ScoredHeads> heads = {
      {ScoredHead(1, 0.9), ScoredHead(2, 0.05)},
      {ScoredHead(0, 0.9), ScoredHead(2, 0.3)},
      {}};
  ArcScores scores(heads, {0.01, 0.02, 0.9});
  config->max_iterations = 0;

  DependencyTreeBuilder builder(sentence, scores, config);
  boost::optional<DependencyTree> tree = builder.build();

  ASSERT_TRUE(tree);
  EXPECT_EQ(BuildOutcome::repaired, builder.outcome());
  EXPECT_TRUE(tree->is_acyclic());
  EXPECT_TRUE(tree->has_single_root());
  EXPECT_EQ(Indices({1, 2, kRootId}), tree->arcs());
}

TEST_F(DependencyTreeBuilderTest, TestBeamAvoidsCycle) {
  ParsingSentence sentence({1, 2, 3}, {{}, {}, {}}, 1);
  std::vector<ScoredHeads> heads = {
      {ScoredHead(1, 0.9), ScoredHead(2, 0.05)},
      {ScoredHead(0, 0.9), ScoredHead(2, 0.3)},
      {}};
  ArcScores scores(heads, {0.01, 0.02, 0.9});

  DependencyTreeBuilder builder(sentence, scores, config);
  boost::optional<DependencyTree> tree = builder.build();

  ASSERT_TRUE(tree);
  EXPECT_EQ(BuildOutcome::beam, builder.outcome());
  EXPECT_TRUE(tree->is_acyclic());
  EXPECT_TRUE(tree->has_single_root());
  EXPECT_EQ(Indices({1, 2, kRootId}), tree->arcs());
}

TEST_F(DependencyTreeBuilderTest, TestSingleRoot) {
  ParsingSentence sentence({1, 2}, {{}, {}}, 1);
  ArcScores scores({{}, {ScoredHead(0, 0.1)}}, {0.9, 0.8});

  DependencyTreeBuilder builder(sentence, scores, config);
  boost::optional<DependencyTree> tree = builder.build();
  ASSERT_TRUE(tree);
  EXPECT_EQ(Indices({kRootId, 0}), tree->arcs());

  config->single_root = false;
  DependencyTreeBuilder forest_builder(sentence, scores, config);
  tree = forest_builder.build();
  ASSERT_TRUE(tree);
  EXPECT_EQ(Indices({kRootId, kRootId}), tree->arcs());
}

TEST_F(DependencyTreeBuilderTest, TestLabels) {
  ParsingSentence sentence({1, 2}, {{{pos_y}}, {{pos_y}}}, 1);
  ArcScores scores({{ScoredHead(1, 0.2)}, {ScoredHead(0, 0.8)}}, {0.9, 0.1});
  StaticDeprelLabeler labeler(
      {{ScoredDeprel(label_w, 0.3), ScoredDeprel(label_x, 0.6)},
       {ScoredDeprel(label_w, 0.5)}});

  DependencyTreeBuilder builder(sentence, scores, config, &labeler);
  boost::optional<DependencyTree> tree = builder.build();

  ASSERT_TRUE(tree);
  EXPECT_EQ(BuildOutcome::beam, builder.outcome());
  EXPECT_EQ(label_x, tree->label_at(0));
  EXPECT_EQ(label_w, tree->label_at(1));
  EXPECT_EQ(Morphology({pos_y}), tree->configuration_at(0));
  EXPECT_NEAR(0.9 + 0.8 + 0.6 + 0.5, tree->score(), 1e-9);
}

TEST_F(DependencyTreeBuilderTest, TestDeprelThreshold) {
  ParsingSentence sentence({1, 2}, {{}, {}}, 1);
  ArcScores scores({{}, {ScoredHead(0, 0.8)}}, {0.9, 0.1});
  StaticDeprelLabeler labeler(
      {{ScoredDeprel(label_w, 0.7), ScoredDeprel(label_x, 0.6)},
       {ScoredDeprel(label_x, 0.4), ScoredDeprel(label_w, 0.3)}});
  config->deprel_score_threshold = 0.5;

  DependencyTreeBuilder builder(sentence, scores, config, &labeler);
  ScoredDeprelsList deprels =
      builder.buildDeprelsMap(builder.buildGreedyTree());

  ASSERT_EQ(2u, deprels.size());
  EXPECT_EQ(2u, deprels[0].size());
  ASSERT_EQ(1u, deprels[1].size());
  EXPECT_EQ(label_x, deprels[1][0].label);

  DependencyTreeBuilder unlabelled(sentence, scores, config);
  EXPECT_THROW(unlabelled.buildDeprelsMap(unlabelled.buildGreedyTree()),
               std::logic_error);
}

TEST_F(DependencyTreeBuilderTest, TestConstraintsIgnored) {
  ParsingSentence sentence({1, 2}, {{{pos_y}}, {{pos_y}}}, 1);
  ArcScores scores({{ScoredHead(1, 0.2)}, {ScoredHead(0, 0.8)}}, {0.9, 0.1});
  StaticDeprelLabeler labeler(
      {{ScoredDeprel(label_x, 1.0)}, {ScoredDeprel(label_x, 1.0)}});
  ConstraintList constraints;
  constraints.push_back(
      parseConstraint("no-x-under-y governor deprel=X => !pos=Y", dict));

  DependencyTreeBuilder builder(sentence, scores, config, &labeler,
                                &constraints);
  boost::optional<DependencyTree> tree = builder.build();

  ASSERT_TRUE(tree);
  EXPECT_EQ(BuildOutcome::unconstrained, builder.outcome());
  EXPECT_EQ(Indices({kRootId, 0}), tree->arcs());
  EXPECT_EQ(label_x, tree->label_at(0));
  EXPECT_EQ(label_x, tree->label_at(1));

  config->strict_constraints = true;
  DependencyTreeBuilder strict_builder(sentence, scores, config, &labeler,
                                       &constraints);
  EXPECT_FALSE(strict_builder.build());
  EXPECT_EQ(BuildOutcome::failed, strict_builder.outcome());
}

TEST_F(DependencyTreeBuilderTest, TestConstraintsSatisfied) {
  ParsingSentence sentence({1, 2}, {{{pos_y}}, {{pos_y}}}, 1);
  ArcScores scores({{ScoredHead(1, 0.2)}, {ScoredHead(0, 0.8)}}, {0.9, 0.1});
  StaticDeprelLabeler labeler(
      {{ScoredDeprel(label_x, 1.0)},
       {ScoredDeprel(label_x, 0.9), ScoredDeprel(label_w, 0.2)}});
  ConstraintList constraints;
  constraints.push_back(
      parseConstraint("no-x-under-y governor deprel=X => !pos=Y", dict));

  DependencyTreeBuilder builder(sentence, scores, config, &labeler,
                                &constraints);
  boost::optional<DependencyTree> tree = builder.build();

  ASSERT_TRUE(tree);
  EXPECT_EQ(BuildOutcome::beam, builder.outcome());
  EXPECT_EQ(label_x, tree->label_at(0));
  EXPECT_EQ(label_w, tree->label_at(1));
}

TEST_F(DependencyTreeBuilderTest, TestDeterminism) {
  ParsingSentence sentence({1, 2, 3, 4}, {{}, {}, {}, {}}, 1);
  std::vector<ScoredHeads> heads = {
      {ScoredHead(1, 0.5), ScoredHead(3, 0.5)},
      {ScoredHead(0, 0.7), ScoredHead(2, 0.4)},
      {ScoredHead(1, 0.6), ScoredHead(3, 0.6)},
      {ScoredHead(2, 0.8), ScoredHead(0, 0.1)}};
  ArcScores scores(heads, {0.3, 0.3, 0.2, 0.3});
  config->max_beam_size = 3;
  config->max_fork_size = 2;

  DependencyTreeBuilder builder1(sentence, scores, config);
  DependencyTreeBuilder builder2(sentence, scores, config);
  boost::optional<DependencyTree> tree1 = builder1.build();
  boost::optional<DependencyTree> tree2 = builder2.build();

  ASSERT_TRUE(tree1);
  ASSERT_TRUE(tree2);
  EXPECT_EQ(*tree1, *tree2);
  EXPECT_EQ(tree1->score(), tree2->score());
  EXPECT_EQ(builder1.outcome(), builder2.outcome());
  EXPECT_EQ(builder1.num_states(), builder2.num_states());
  EXPECT_TRUE(tree1->is_acyclic());
  EXPECT_TRUE(tree1->has_single_root());
}

TEST_F(DependencyTreeBuilderTest, TestLabelsPredictedOncePerTree) {
  ParsingSentence sentence({1, 2}, {{{pos_y}}, {{pos_y}}}, 1);
  ArcScores scores({{ScoredHead(1, 0.2)}, {ScoredHead(0, 0.8)}}, {0.9, 0.1});
  CountingDeprelLabeler labeler(
      {{ScoredDeprel(label_x, 0.6)}, {ScoredDeprel(label_w, 0.5)}});

  DependencyTreeBuilder builder(sentence, scores, config, &labeler);
  boost::optional<DependencyTree> tree = builder.build();

  ASSERT_TRUE(tree);
  EXPECT_EQ(BuildOutcome::beam, builder.outcome());
  EXPECT_EQ(Indices({kRootId, 0}), tree->arcs());
  EXPECT_EQ(label_x, tree->label_at(0));
  // Four states, two of them well-formed trees.
  EXPECT_EQ(4, builder.num_states());
  EXPECT_EQ(2, labeler.calls());
}

class LargerBeamTest : public DependencyTreeBuilderTest {
 protected:
  void SetUp() override {
    DependencyTreeBuilderTest::SetUp();
    heads = {{ScoredHead(2, 0.8), ScoredHead(3, 0.6)},
             {ScoredHead(0, 0.1), ScoredHead(2, 0.9), ScoredHead(4, 0.4)},
             {ScoredHead(0, 0.6), ScoredHead(4, 0.0)},
             {ScoredHead(0, 0.8), ScoredHead(1, 1.0), ScoredHead(2, 0.3),
              ScoredHead(4, 0.7)},
             {ScoredHead(2, 0.2)}};
    root_scores = {0.5, 0.4, 0.0, 0.2, 1.0};
  }

  std::vector<ScoredHeads> heads;
  Reals root_scores;
};

TEST_F(LargerBeamTest, TestLargerBeamNeverWorse) {
  ParsingSentence sentence({1, 2, 3, 4, 5}, {{}, {}, {}, {}, {}}, 1);
  ArcScores scores(heads, root_scores);
  config->max_fork_size = 5;
  config->max_iterations = 3;

  config->max_beam_size = 4;
  DependencyTreeBuilder narrow_builder(sentence, scores, config);
  boost::optional<DependencyTree> narrow = narrow_builder.build();
  ASSERT_TRUE(narrow);
  EXPECT_EQ(BuildOutcome::beam, narrow_builder.outcome());
  EXPECT_EQ(Indices({3, 2, 0, 4, kRootId}), narrow->arcs());
  EXPECT_NEAR(3.8, narrow->score(), 1e-9);

  config->max_beam_size = 5;
  DependencyTreeBuilder wide_builder(sentence, scores, config);
  boost::optional<DependencyTree> wide = wide_builder.build();
  ASSERT_TRUE(wide);
  EXPECT_EQ(BuildOutcome::beam, wide_builder.outcome());
  EXPECT_EQ(Indices({3, 2, 0, 4, kRootId}), wide->arcs());
  EXPECT_GE(wide->score(), narrow->score());
  EXPECT_GE(wide_builder.num_states(), narrow_builder.num_states());
}

TEST_F(LargerBeamTest, TestScoreNeverDecreases) {
  ParsingSentence sentence({1, 2, 3, 4, 5}, {{}, {}, {}, {}, {}}, 1);
  ArcScores scores(heads, root_scores);

  for (unsigned iterations = 1; iterations < 5; ++iterations) {
    Real previous = 0;
    for (unsigned beam_size = 1; beam_size < 8; ++beam_size) {
      config->max_beam_size = beam_size;
      config->max_iterations = iterations;
      DependencyTreeBuilder builder(sentence, scores, config);
      boost::optional<DependencyTree> tree = builder.build();
      ASSERT_TRUE(tree);
      EXPECT_TRUE(tree->is_acyclic());
      EXPECT_TRUE(tree->has_single_root());
      if (builder.outcome() == BuildOutcome::beam) {
        EXPECT_GE(tree->score() + 1e-9, previous);
        previous = tree->score();
      }
    }
  }
}

TEST_F(DependencyTreeBuilderTest, TestRepairedTreeSingleRoot) {
  ParsingSentence sentence({1, 2, 3, 4, 5}, {{}, {}, {}, {}, {}}, 1);
  std::vector<ScoredHeads> heads = {
      {ScoredHead(1, 0.8), ScoredHead(2, 0.3), ScoredHead(4, 0.3)},
      {ScoredHead(0, 0.9), ScoredHead(2, 0.3)},
      {ScoredHead(4, 0.4)},
      {ScoredHead(2, 0.1), ScoredHead(4, 0.3)},
      {ScoredHead(2, 0.1)}};
  ArcScores scores(heads, {0.6, 0.5, 0.6, 0.7, 0.1});
  config->max_iterations = 0;

  DependencyTreeBuilder builder(sentence, scores, config);
  boost::optional<DependencyTree> tree = builder.build();

  ASSERT_TRUE(tree);
  EXPECT_EQ(BuildOutcome::repaired, builder.outcome());
  EXPECT_TRUE(tree->is_acyclic());
  EXPECT_TRUE(tree->has_single_root());
  EXPECT_EQ(Indices({2, 0, kRootId, 4, 2}), tree->arcs());
  EXPECT_NEAR(2.2, tree->score(), 1e-9);

  config->single_root = false;
  DependencyTreeBuilder forest_builder(sentence, scores, config);
  tree = forest_builder.build();
  ASSERT_TRUE(tree);
  EXPECT_TRUE(tree->is_acyclic());
  EXPECT_EQ(2u, tree->root_count());
}

TEST_F(DependencyTreeBuilderTest, TestMismatchedScores) {
  ParsingSentence sentence({1, 2}, {{}, {}}, 1);
  ArcScores scores({{}}, {0.9});
  EXPECT_THROW(DependencyTreeBuilder(sentence, scores, config),
               std::invalid_argument);
}

}  // namespace lhrtree
