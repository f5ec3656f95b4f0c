#ifndef _CORPUS_PARSING_SENT_H_
#define _CORPUS_PARSING_SENT_H_

#include "corpus/dict.h"
#include "corpus/sentence.h"

namespace lhrtree {

// A morphological analysis: the POS tags of its components, more than one for
// contracted forms (e.g. ADP+DET).
typedef Words Morphology;
typedef std::vector<Morphology> Morphologies;

// The input sentence of the tree builder. Token ids are the positions
// 0..size()-1; gold arcs and labels are optional (empty when unannotated),
// with -1 marking the root attachment.
class ParsingSentence : public Sentence {
 public:
  ParsingSentence();

  ParsingSentence(Words sent, std::vector<Morphologies> morphologies, int id);

  ParsingSentence(Words sent, std::vector<Morphologies> morphologies,
                  Indices gold_arcs, Words gold_labels, int id);

  const Morphologies& morphologies_at(WordIndex i) const {
    return morphologies_.at(i);
  }

  bool has_gold_arcs() const { return !gold_arcs_.empty(); }

  bool has_gold_labels() const { return !gold_labels_.empty(); }

  WordIndex gold_arc_at(WordIndex i) const { return gold_arcs_.at(i); }

  WordId gold_label_at(WordIndex i) const { return gold_labels_.at(i); }

  // The first POS of the first analysis, or -1 when the token has none.
  WordId first_tag_at(WordIndex i) const {
    const Morphologies& morphologies = morphologies_.at(i);
    if (morphologies.empty() || morphologies.front().empty()) return -1;
    return morphologies.front().front();
  }

 private:
  void check() const;

  std::vector<Morphologies> morphologies_;
  Indices gold_arcs_;
  Words gold_labels_;
};

}  // namespace lhrtree

#endif
