#include "lhr/arc_scores.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace lhrtree {

ArcScores::ArcScores(const std::vector<ScoredHeads>& heads,
                     const Reals& root_scores)
    : sorted_heads_(heads.size()), root_scores_(root_scores) {
  if (heads.empty()) {
    throw std::invalid_argument("Arc scores need at least one token");
  }
  if (root_scores.size() != heads.size()) {
    throw std::invalid_argument(
        "A root score is required for every token");
  }

  WordIndex n = static_cast<WordIndex>(heads.size());
  for (WordIndex i = 0; i < n; ++i) {
    std::vector<bool> seen(n, false);
    for (const ScoredHead& head : heads[i]) {
      if (head.governor < 0 || head.governor >= n || head.governor == i) {
        throw std::invalid_argument("Invalid candidate governor " +
                                    std::to_string(head.governor) +
                                    " of token " + std::to_string(i));
      }
      if (seen[head.governor]) {
        throw std::invalid_argument("Duplicate candidate governor " +
                                    std::to_string(head.governor) +
                                    " of token " + std::to_string(i));
      }
      seen[head.governor] = true;
      sorted_heads_[i].push_back(head);
    }
    sorted_heads_[i].push_back(ScoredHead(kRootId, root_scores[i]));
    std::stable_sort(sorted_heads_[i].begin(), sorted_heads_[i].end(),
                     ArcScores::cmp_heads);
  }
}

boost::optional<ScoredHead> ArcScores::highest_scoring_head(
    WordIndex dependent, const Indices& except) const {
  for (const ScoredHead& head : sorted_heads(dependent)) {
    if (std::find(except.begin(), except.end(), head.governor) ==
        except.end()) {
      return head;
    }
  }

  return boost::none;
}

std::pair<WordIndex, Real> ArcScores::highest_scoring_top() const {
  WordIndex top = 0;
  for (WordIndex i = 1; i < static_cast<WordIndex>(size()); ++i) {
    if (root_scores_[i] > root_scores_[top]) top = i;
  }

  return std::make_pair(top, root_scores_[top]);
}

}  // namespace lhrtree
