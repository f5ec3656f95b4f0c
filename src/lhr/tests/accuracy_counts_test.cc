#include "gtest/gtest.h"

#include <stdexcept>

#include "lhr/accuracy_counts.h"

namespace lhrtree {

class AccuracyCountsTest : public testing::Test {
 protected:
  void SetUp() override {
    dict = boost::make_shared<Dict>();
    noun = dict->convertTag("NOUN", false);
    punct = dict->convertTag("PUNCT", false);
    root = dict->convertLabel("root", false);
    nsubj = dict->convertLabel("nsubj", false);
    obj = dict->convertLabel("obj", false);
    punct_label = dict->convertLabel("punct", false);

    gold = ParsingSentence({1, 2, 3}, {{{noun}}, {{noun}}, {{punct}}},
                           {kRootId, 0, 0}, {root, nsubj, punct_label}, 1);
  }

  boost::shared_ptr<Dict> dict;
  WordId noun, punct, root, nsubj, obj, punct_label;
  ParsingSentence gold;
};

TEST_F(AccuracyCountsTest, TestCountAccuracy) {
  DependencyTree tree(3);
  tree.set_attachment_score(0, 0.9);
  tree.set_deprel(0, root);
  tree.set_arc(1, 0, obj, 0.5);
  tree.set_arc(2, 1, punct_label, 0.4);
  tree.set_configuration(0, {noun});

  AccuracyCounts acc_counts(dict);
  acc_counts.countAccuracy(tree, gold);

  EXPECT_EQ(1, acc_counts.num_sentences());
  EXPECT_EQ(3, acc_counts.total_length());
  EXPECT_EQ(2, acc_counts.total_length_nopunc());
  EXPECT_DOUBLE_EQ(2.0 / 3, acc_counts.directed_accuracy());
  EXPECT_DOUBLE_EQ(1.0 / 3, acc_counts.directed_accuracy_lab());
  EXPECT_DOUBLE_EQ(1.0, acc_counts.directed_accuracy_nopunc());
  EXPECT_DOUBLE_EQ(0.5, acc_counts.directed_accuracy_lab_nopunc());
  EXPECT_DOUBLE_EQ(1.0, acc_counts.root_accuracy());
  EXPECT_DOUBLE_EQ(1.0 / 3, acc_counts.tag_accuracy());
  EXPECT_DOUBLE_EQ(0.0, acc_counts.complete_accuracy());
  EXPECT_DOUBLE_EQ(1.0, acc_counts.complete_accuracy_nopunc());
  EXPECT_DOUBLE_EQ(0.0, acc_counts.complete_accuracy_lab_nopunc());
}

TEST_F(AccuracyCountsTest, TestCompleteSentences) {
  DependencyTree tree(3);
  tree.set_attachment_score(0, 0.9);
  tree.set_deprel(0, root);
  tree.set_arc(1, 0, nsubj, 0.5);
  tree.set_arc(2, 0, punct_label, 0.4);

  AccuracyCounts acc_counts(dict);
  acc_counts.countAccuracy(tree, gold);
  acc_counts.countAccuracy(DependencyTree(3), gold);

  EXPECT_EQ(2, acc_counts.num_sentences());
  EXPECT_DOUBLE_EQ(0.5, acc_counts.complete_accuracy());
  EXPECT_DOUBLE_EQ(0.5, acc_counts.complete_accuracy_lab());
  EXPECT_DOUBLE_EQ(1.0, acc_counts.root_accuracy());
  EXPECT_DOUBLE_EQ(4.0 / 6, acc_counts.directed_accuracy());
}

TEST_F(AccuracyCountsTest, TestEmptyCounts) {
  AccuracyCounts acc_counts(dict);
  EXPECT_DOUBLE_EQ(0.0, acc_counts.directed_accuracy());
  EXPECT_DOUBLE_EQ(0.0, acc_counts.root_accuracy());
}

TEST_F(AccuracyCountsTest, TestInvalidGold) {
  AccuracyCounts acc_counts(dict);
  ParsingSentence unannotated({1, 2}, {{}, {}}, 2);
  EXPECT_THROW(acc_counts.countAccuracy(DependencyTree(2), unannotated),
               std::invalid_argument);
  EXPECT_THROW(acc_counts.countAccuracy(DependencyTree(2), gold),
               std::invalid_argument);
}

TEST_F(AccuracyCountsTest, TestCountFailure) {
  DependencyTree tree(3);
  tree.set_attachment_score(0, 0.9);
  tree.set_deprel(0, root);
  tree.set_arc(1, 0, nsubj, 0.5);
  tree.set_arc(2, 0, punct_label, 0.4);

  AccuracyCounts acc_counts(dict);
  acc_counts.countAccuracy(tree, gold);
  acc_counts.countFailure(gold);

  EXPECT_EQ(2, acc_counts.num_sentences());
  EXPECT_EQ(6, acc_counts.total_length());
  EXPECT_EQ(4, acc_counts.total_length_nopunc());
  EXPECT_DOUBLE_EQ(0.5, acc_counts.directed_accuracy());
  EXPECT_DOUBLE_EQ(0.5, acc_counts.directed_accuracy_lab());
  EXPECT_DOUBLE_EQ(0.5, acc_counts.directed_accuracy_nopunc());
  EXPECT_DOUBLE_EQ(0.5, acc_counts.root_accuracy());
  EXPECT_DOUBLE_EQ(0.5, acc_counts.complete_accuracy());

  ParsingSentence unannotated({1, 2}, {{}, {}}, 1);
  EXPECT_THROW(acc_counts.countFailure(unannotated), std::invalid_argument);
}

}  // namespace lhrtree
