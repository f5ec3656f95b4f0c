#ifndef _LHR_SCORED_CORPUS_H_
#define _LHR_SCORED_CORPUS_H_

#include <string>
#include <iostream>

#include "corpus/dict.h"
#include "corpus/parsing_sentence.h"
#include "lhr/arc_scores.h"
#include "lhr/dependency_tree.h"

namespace lhrtree {

// Sentences with the arc and deprel scores of the external scorer. Each token
// line has eight whitespace separated columns:
//   ID FORM MORPHOLOGIES GOLD_HEAD GOLD_LABEL ROOT_SCORE HEADS LABELS
// with 1-based ids, '|' separated analyses of '+' joined POS tags,
// comma separated GOV:SCORE heads and LABEL:SCORE deprels, '_' for none.
// Sentences are separated by blank lines.
class ScoredCorpus {
 public:
  ScoredCorpus();

  void readFile(const std::string& filename,
                const boost::shared_ptr<Dict>& dict, bool frozen);

  void read(std::istream& in, const boost::shared_ptr<Dict>& dict,
            bool frozen);

  size_t size() const { return sentences_.size(); }

  size_t numTokens() const;

  const ParsingSentence& sentence_at(unsigned i) const {
    return sentences_.at(i);
  }

  const ArcScores& scores_at(unsigned i) const { return *scores_.at(i); }

  const ScoredDeprelsList& deprels_at(unsigned i) const {
    return deprels_.at(i);
  }

  // Whether any token of the corpus comes with deprel scores.
  bool has_deprels() const { return has_deprels_; }

  // Whether any token of the i-th sentence comes with deprel scores.
  bool has_deprels_at(unsigned i) const { return sentence_deprels_.at(i); }

 private:
  struct TokenLine {
    WordIndex id;
    WordId word;
    Morphologies morphologies;
    WordIndex gold_head;
    WordId gold_label;
    Real root_score;
    ScoredHeads heads;
    ScoredDeprels deprels;
  };

  TokenLine convertLine(const std::string& line, int line_num,
                        const boost::shared_ptr<Dict>& dict, bool frozen);

  void addSentence(const std::vector<TokenLine>& tokens, int first_line);

  std::vector<ParsingSentence> sentences_;
  std::vector<boost::shared_ptr<ArcScores>> scores_;
  std::vector<ScoredDeprelsList> deprels_;
  std::vector<bool> sentence_deprels_;
  bool has_deprels_;
};

// The tree in CoNLL-X format: ID FORM _ POS _ _ HEAD DEPREL _ _.
std::string conllString(const ParsingSentence& sentence,
                        const DependencyTree& tree, const Dict& dict);

}  // namespace lhrtree

#endif
