#include "corpus/parsing_sentence.h"

#include <stdexcept>

namespace lhrtree {

ParsingSentence::ParsingSentence()
    : Sentence(), morphologies_(), gold_arcs_(), gold_labels_() {}

ParsingSentence::ParsingSentence(Words sent,
                                 std::vector<Morphologies> morphologies,
                                 int id)
    : Sentence(sent, id),
      morphologies_(morphologies),
      gold_arcs_(),
      gold_labels_() {
  check();
}

ParsingSentence::ParsingSentence(Words sent,
                                 std::vector<Morphologies> morphologies,
                                 Indices gold_arcs, Words gold_labels, int id)
    : Sentence(sent, id),
      morphologies_(morphologies),
      gold_arcs_(gold_arcs),
      gold_labels_(gold_labels) {
  check();
}

void ParsingSentence::check() const {
  if (size() == 0) {
    throw std::invalid_argument("A sentence must contain at least one token");
  }
  if (morphologies_.size() != size()) {
    throw std::invalid_argument(
        "The morphologies must be given for every token of the sentence");
  }
  if (!gold_arcs_.empty()) {
    if (gold_arcs_.size() != size()) {
      throw std::invalid_argument("Gold heads must cover every token");
    }
    for (WordIndex i = 0; i < static_cast<WordIndex>(size()); ++i) {
      WordIndex j = gold_arcs_[i];
      if (j < -1 || j >= static_cast<WordIndex>(size()) || j == i) {
        throw std::invalid_argument("Invalid gold head of token " +
                                    std::to_string(i));
      }
    }
  }
  if (!gold_labels_.empty() && gold_labels_.size() != size()) {
    throw std::invalid_argument("Gold labels must cover every token");
  }
}

}  // namespace lhrtree
