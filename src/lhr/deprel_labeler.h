#ifndef _LHR_DEPREL_LABELER_H_
#define _LHR_DEPREL_LABELER_H_

#include "lhr/dependency_tree.h"
#include "lhr/utils.h"

namespace lhrtree {

// The external deprel scorer.
class DeprelLabeler {
 public:
  virtual ~DeprelLabeler() {}

  // The scored deprels of every token given the heads of the tree, sorted by
  // descending score.
  virtual ScoredDeprelsList predict(const DependencyTree& tree) const = 0;
};

// Serves deprel scores computed in advance, independently of the heads.
class StaticDeprelLabeler : public DeprelLabeler {
 public:
  explicit StaticDeprelLabeler(const ScoredDeprelsList& scores);

  ScoredDeprelsList predict(const DependencyTree& tree) const override;

  static bool cmp_deprels(const ScoredDeprel& d1, const ScoredDeprel& d2) {
    if (d1.score != d2.score) return (d1.score > d2.score);
    return (d1.label < d2.label);
  }

 private:
  ScoredDeprelsList scores_;
};

}  // namespace lhrtree

#endif
