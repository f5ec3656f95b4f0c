#ifndef _LHR_CYCLES_FIXER_H_
#define _LHR_CYCLES_FIXER_H_

#include "lhr/arc_scores.h"
#include "lhr/dependency_tree.h"

namespace lhrtree {

// Rewrites the arcs of a tree built with cycles allowed until it is acyclic,
// losing as little score as possible with respect to the current arcs, and
// reduces the roots of an acyclic tree to a single one.
class CyclesFixer {
 public:
  CyclesFixer(DependencyTree* tree, const ArcScores& scores);

  // Repairs one cycle at a time. Returns the number of repaired arcs.
  int fixCycles();

  // Attaches the extra roots of an acyclic tree under other tokens, the
  // cheapest move first. If the moves get stuck the tree is regrown from the
  // candidate arcs of each possible top. The tree keeps several roots only
  // when no candidate tree has a single one. Returns the number of moved
  // roots.
  int fixRoots();

 private:
  void fixCycle(const Indices& cycle);

  // Replaces the arcs by the best spanning tree grown from a top along the
  // highest scoring candidate arcs. Returns false if no top reaches every
  // token.
  bool regrowTree();

  // Candidate tree grown from top, none if some token cannot be reached.
  boost::optional<DependencyTree> growTree(WordIndex top) const;

  // Best governor of i that does not close a cycle and is not the root.
  boost::optional<ScoredHead> bestAlternative(WordIndex i) const;

  DependencyTree* tree_;
  const ArcScores& scores_;
};

}  // namespace lhrtree

#endif
