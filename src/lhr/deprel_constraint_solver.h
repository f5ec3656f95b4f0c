#ifndef _LHR_DEPREL_CONSTRAINT_SOLVER_H_
#define _LHR_DEPREL_CONSTRAINT_SOLVER_H_

#include <stdexcept>

#include "corpus/parsing_sentence.h"
#include "lhr/constraint.h"
#include "lhr/dependency_tree.h"
#include "lhr/morpho_deprel_selector.h"

namespace lhrtree {

// Thrown when no labelling of a tree satisfies the constraints.
class InvalidConfiguration : public std::runtime_error {
 public:
  explicit InvalidConfiguration(const std::string& what)
      : std::runtime_error(what) {}
};

// Chooses a deprel and a morphological configuration for every token of an
// acyclic tree so that no constraint is violated.
//
// Tokens are assigned top-down from the root, trying their candidates in
// descending deprel score order, and backtracking on violations. The first
// complete assignment found is kept. The search is deterministic and bounded
// by max_steps tried choices.
class DeprelConstraintSolver {
 public:
  DeprelConstraintSolver(const ParsingSentence& sentence, DependencyTree* tree,
                         const ConstraintList& constraints,
                         const MorphoDeprelSelector& selector,
                         const ScoredDeprelsList& deprels,
                         int max_steps = 10000);

  // Annotates the tree, throws InvalidConfiguration if there is no valid
  // labelling within the step budget.
  void solve();

  int num_steps() const { return steps_; }

 private:
  struct Choice {
    WordId deprel;
    Real score;
    Morphology configuration;
  };

  void buildChoices(const ScoredDeprelsList& deprels);

  void buildOrder();

  bool search(size_t k);

  bool verified(WordIndex i) const;

  MorphoSynToken tokenView(WordIndex i) const;

  const ParsingSentence& sentence_;
  DependencyTree* tree_;
  const ConstraintList& constraints_;
  const MorphoDeprelSelector& selector_;
  int max_steps_;
  int steps_;
  std::vector<std::vector<Choice>> choices_;
  Indices order_;
  Indices assigned_;
};

}  // namespace lhrtree

#endif
