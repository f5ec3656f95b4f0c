#include "lhr/accuracy_counts.h"

#include <iostream>
#include <stdexcept>

namespace lhrtree {

AccuracyCounts::AccuracyCounts(boost::shared_ptr<Dict> dict)
    : dict_(dict),
      total_length_{0},
      total_length_nopunc_{0},
      tag_count_{0},
      directed_count_{0},
      directed_count_lab_{0},
      directed_count_nopunc_{0},
      directed_count_lab_nopunc_{0},
      root_count_{0},
      complete_sentences_{0},
      complete_sentences_lab_{0},
      complete_sentences_nopunc_{0},
      complete_sentences_lab_nopunc_{0},
      num_sentences_{0} {}

void AccuracyCounts::countAccuracy(const DependencyTree& tree,
                                   const ParsingSentence& gold_sentence) {
  if (!gold_sentence.has_gold_arcs()) {
    throw std::invalid_argument("The gold sentence has no annotated heads");
  }
  if (tree.size() != gold_sentence.size()) {
    throw std::invalid_argument(
        "The dependency tree and its gold haven't the same size");
  }

  // Sentence level counts.
  inc_num_sentences();
  add_total_length(tree.size());
  bool complete = true;
  bool lab_complete = true;
  bool punc_complete = true;
  bool lab_punc_complete = true;
  bool labelled = gold_sentence.has_gold_labels();

  // Arc level counts.
  for (WordIndex j = 0; j < static_cast<WordIndex>(tree.size()); ++j) {
    bool punct = dict_->punctTag(gold_sentence.first_tag_at(j));
    bool arc_correct = (tree.head_at(j) == gold_sentence.gold_arc_at(j));
    bool label_correct =
        !labelled || (tree.label_at(j) == gold_sentence.gold_label_at(j));

    if (arc_correct) {
      inc_directed_count();
      if (label_correct) inc_directed_count_lab();
      if (!punct) {
        inc_directed_count_nopunc();
        if (label_correct) inc_directed_count_lab_nopunc();
      }
      if (!tree.has_head_at(j)) inc_root_count();
    }

    if (!arc_correct) {
      complete = false;
      lab_complete = false;
    } else if (!label_correct) {
      lab_complete = false;
    }

    const Morphology& configuration = tree.configuration_at(j);
    if (!configuration.empty() &&
        configuration.front() == gold_sentence.first_tag_at(j)) {
      inc_tag_count();
    }

    if (!punct) {
      inc_total_length_nopunc();
      if (!arc_correct) {
        punc_complete = false;
        lab_punc_complete = false;
      } else if (!label_correct) {
        lab_punc_complete = false;
      }
    }
  }

  if (complete) inc_complete_sentences();
  if (lab_complete) inc_complete_sentences_lab();
  if (punc_complete) inc_complete_sentences_nopunc();
  if (lab_punc_complete) inc_complete_sentences_lab_nopunc();
}

void AccuracyCounts::countFailure(const ParsingSentence& gold_sentence) {
  if (!gold_sentence.has_gold_arcs()) {
    throw std::invalid_argument("The gold sentence has no annotated heads");
  }

  inc_num_sentences();
  add_total_length(gold_sentence.size());
  for (WordIndex j = 0; j < static_cast<WordIndex>(gold_sentence.size()); ++j) {
    if (!dict_->punctTag(gold_sentence.first_tag_at(j))) {
      inc_total_length_nopunc();
    }
  }
}

void AccuracyCounts::printAccuracy() const {
  std::cerr << "Labelled Accuracy: " << directed_accuracy_lab() << std::endl;
  std::cerr << "Unlabelled Accuracy: " << directed_accuracy() << std::endl;
  std::cerr << "Labelled Accuracy No Punct: " << directed_accuracy_lab_nopunc()
            << std::endl;
  std::cerr << "Unlabelled Accuracy No Punct: " << directed_accuracy_nopunc()
            << std::endl;
  std::cerr << "Root correct: " << root_accuracy() << std::endl;
  std::cerr << "POS correct: " << tag_accuracy() << std::endl;
  std::cerr << "Labelled Completely correct: " << complete_accuracy_lab()
            << std::endl;
  std::cerr << "Completely correct: " << complete_accuracy() << std::endl;
  std::cerr << "Labelled Completely correct No Punct: "
            << complete_accuracy_lab_nopunc() << std::endl;
  std::cerr << "Completely correct No Punct: " << complete_accuracy_nopunc()
            << std::endl;
}

}  // namespace lhrtree
