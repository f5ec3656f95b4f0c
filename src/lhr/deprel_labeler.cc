#include "lhr/deprel_labeler.h"

#include <algorithm>

namespace lhrtree {

StaticDeprelLabeler::StaticDeprelLabeler(const ScoredDeprelsList& scores)
    : scores_(scores) {
  for (ScoredDeprels& deprels : scores_) {
    std::stable_sort(deprels.begin(), deprels.end(),
                     StaticDeprelLabeler::cmp_deprels);
  }
}

ScoredDeprelsList StaticDeprelLabeler::predict(
    const DependencyTree& tree) const {
  if (scores_.size() != tree.size()) {
    throw std::invalid_argument(
        "The deprel scores do not match the size of the tree");
  }

  return scores_;
}

}  // namespace lhrtree
