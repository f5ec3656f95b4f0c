#ifndef _LHR_MORPHO_DEPREL_SELECTOR_H_
#define _LHR_MORPHO_DEPREL_SELECTOR_H_

#include "corpus/dict.h"
#include "corpus/parsing_sentence.h"
#include "lhr/utils.h"

namespace lhrtree {

// Relates the deprels of a token to its morphological analyses.
class MorphoDeprelSelector {
 public:
  virtual ~MorphoDeprelSelector() {}

  // The deprels compatible with the token, in the given order. head is
  // kRootId for the top of the tree.
  virtual ScoredDeprels validDeprels(const ScoredDeprels& deprels,
                                     const ParsingSentence& sentence,
                                     WordIndex token,
                                     WordIndex head) const = 0;

  // The analyses of the token compatible with the deprel.
  virtual Morphologies validMorphologies(const ParsingSentence& sentence,
                                         WordIndex token,
                                         WordId deprel) const = 0;
};

// Every deprel is valid with every analysis.
class PassThroughDeprelSelector : public MorphoDeprelSelector {
 public:
  ScoredDeprels validDeprels(const ScoredDeprels& deprels,
                             const ParsingSentence& sentence, WordIndex token,
                             WordIndex head) const override {
    return deprels;
  }

  Morphologies validMorphologies(const ParsingSentence& sentence,
                                 WordIndex token,
                                 WordId deprel) const override {
    return sentence.morphologies_at(token);
  }
};

// Selector for composite deprels, whose label annotates the POS of every
// component of the analysis: "POS~REL" or "POS~REL POS~REL". A deprel is
// valid with the analyses having exactly its POS sequence. Tokens without
// analyses accept any deprel.
class CompositeDeprelSelector : public MorphoDeprelSelector {
 public:
  explicit CompositeDeprelSelector(const boost::shared_ptr<Dict>& dict);

  ScoredDeprels validDeprels(const ScoredDeprels& deprels,
                             const ParsingSentence& sentence, WordIndex token,
                             WordIndex head) const override;

  Morphologies validMorphologies(const ParsingSentence& sentence,
                                 WordIndex token,
                                 WordId deprel) const override;

  // The POS tags annotated in the label of the deprel.
  Words extractPosTags(WordId deprel) const;

 private:
  boost::shared_ptr<Dict> dict_;
};

}  // namespace lhrtree

#endif
