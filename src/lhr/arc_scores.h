#ifndef _LHR_ARC_SCORES_H_
#define _LHR_ARC_SCORES_H_

#include <utility>

#include <boost/optional.hpp>

#include "lhr/utils.h"

namespace lhrtree {

// Scored candidate heads of every token of a sentence, as produced by the
// external scorer. The root attachment of each token is kept in the same
// sorted list under the kRootId governor. Read-only after construction.
class ArcScores {
 public:
  // heads[i] lists the candidate (non-root) governors of token i,
  // root_scores[i] is the score of token i being the top of the tree.
  ArcScores(const std::vector<ScoredHeads>& heads, const Reals& root_scores);

  size_t size() const { return sorted_heads_.size(); }

  // Candidates sorted by descending score, ties by ascending governor id.
  const ScoredHeads& sorted_heads(WordIndex dependent) const {
    return sorted_heads_.at(dependent);
  }

  Real root_score(WordIndex dependent) const {
    return root_scores_.at(dependent);
  }

  // The best candidate of the dependent whose governor is not excluded.
  boost::optional<ScoredHead> highest_scoring_head(
      WordIndex dependent, const Indices& except) const;

  // The token most likely to be the top of the tree, with its root score.
  std::pair<WordIndex, Real> highest_scoring_top() const;

  static bool cmp_heads(const ScoredHead& h1, const ScoredHead& h2) {
    if (h1.score != h2.score) return (h1.score > h2.score);
    return (h1.governor < h2.governor);
  }

 private:
  std::vector<ScoredHeads> sorted_heads_;
  Reals root_scores_;
};

}  // namespace lhrtree

#endif
