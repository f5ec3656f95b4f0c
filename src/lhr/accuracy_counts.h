#ifndef _LHR_ACC_COUNTS_H_
#define _LHR_ACC_COUNTS_H_

#include "corpus/dict.h"
#include "corpus/parsing_sentence.h"
#include "lhr/dependency_tree.h"

namespace lhrtree {

// Attachment accuracy of built trees against the gold annotation.
class AccuracyCounts {
 public:
  AccuracyCounts(boost::shared_ptr<Dict> dict);

  void inc_num_sentences() { ++num_sentences_; }

  void inc_complete_sentences() { ++complete_sentences_; }

  void inc_complete_sentences_lab() { ++complete_sentences_lab_; }

  void inc_complete_sentences_nopunc() { ++complete_sentences_nopunc_; }

  void inc_complete_sentences_lab_nopunc() {
    ++complete_sentences_lab_nopunc_;
  }

  void inc_root_count() { ++root_count_; }

  void inc_directed_count() { ++directed_count_; }

  void inc_directed_count_lab() { ++directed_count_lab_; }

  void inc_directed_count_nopunc() { ++directed_count_nopunc_; }

  void inc_directed_count_lab_nopunc() { ++directed_count_lab_nopunc_; }

  void inc_tag_count() { ++tag_count_; }

  void inc_total_length_nopunc() { ++total_length_nopunc_; }

  void add_total_length(int l) { total_length_ += l; }

  // Counts a tree built for a sentence with gold heads. Gold labels are
  // optional; without them labelled counts follow unlabelled ones.
  void countAccuracy(const DependencyTree& tree,
                     const ParsingSentence& gold_sentence);

  // Counts a sentence left without tree: none of its tokens is correct.
  void countFailure(const ParsingSentence& gold_sentence);

  void printAccuracy() const;

  Real directed_accuracy() const {
    return ratio(directed_count_, total_length_);
  }

  Real directed_accuracy_lab() const {
    return ratio(directed_count_lab_, total_length_);
  }

  Real directed_accuracy_nopunc() const {
    return ratio(directed_count_nopunc_, total_length_nopunc_);
  }

  Real directed_accuracy_lab_nopunc() const {
    return ratio(directed_count_lab_nopunc_, total_length_nopunc_);
  }

  Real tag_accuracy() const { return ratio(tag_count_, total_length_); }

  Real complete_accuracy() const {
    return ratio(complete_sentences_, num_sentences_);
  }

  Real complete_accuracy_lab() const {
    return ratio(complete_sentences_lab_, num_sentences_);
  }

  Real complete_accuracy_nopunc() const {
    return ratio(complete_sentences_nopunc_, num_sentences_);
  }

  Real complete_accuracy_lab_nopunc() const {
    return ratio(complete_sentences_lab_nopunc_, num_sentences_);
  }

  Real root_accuracy() const { return ratio(root_count_, num_sentences_); }

  int num_sentences() const { return num_sentences_; }

  int total_length() const { return total_length_; }

  int total_length_nopunc() const { return total_length_nopunc_; }

 private:
  static Real ratio(int count, int total) {
    return (total > 0) ? (count + 0.0) / total : 0.0;
  }

  boost::shared_ptr<Dict> dict_;
  int total_length_;
  int total_length_nopunc_;
  int tag_count_;
  int directed_count_;
  int directed_count_lab_;
  int directed_count_nopunc_;
  int directed_count_lab_nopunc_;
  int root_count_;
  int complete_sentences_;
  int complete_sentences_lab_;
  int complete_sentences_nopunc_;
  int complete_sentences_lab_nopunc_;
  int num_sentences_;
};

}  // namespace lhrtree

#endif
