#ifndef _LHR_DEPENDENCY_TREE_BUILDER_H_
#define _LHR_DEPENDENCY_TREE_BUILDER_H_

#include <map>

#include <boost/optional.hpp>

#include "corpus/model_config.h"
#include "corpus/parsing_sentence.h"
#include "lhr/arc_scores.h"
#include "lhr/beam_manager.h"
#include "lhr/constraint.h"
#include "lhr/cycles_fixer.h"
#include "lhr/dependency_tree.h"
#include "lhr/deprel_constraint_solver.h"
#include "lhr/deprel_labeler.h"
#include "lhr/morpho_deprel_selector.h"

namespace lhrtree {

// How the tree returned by DependencyTreeBuilder::build() was obtained.
enum class BuildOutcome { none, beam, repaired, unconstrained, failed };

// Builds the best dependency tree of a sentence from its arc scores.
//
// The arcs are explored with a beam of parallel states, each state choosing a
// candidate head for every token; a state is valid when its tree is acyclic,
// single-rooted (unless disabled) and, with constraints, can be labelled
// without violations. Without a valid state the tree is built greedily from
// the best heads, its cycles are fixed, and the labels are assigned with the
// constraints if possible, else ignoring them (or giving up when
// strict_constraints is set).
class DependencyTreeBuilder {
 public:
  // labeler, constraints and selector may be null. Without labeler no deprel
  // is assigned.
  DependencyTreeBuilder(const ParsingSentence& sentence,
                        const ArcScores& scores,
                        const boost::shared_ptr<ModelConfig>& config,
                        const DeprelLabeler* labeler = nullptr,
                        const ConstraintList* constraints = nullptr,
                        const MorphoDeprelSelector* selector = nullptr);

  boost::optional<DependencyTree> build();

  BuildOutcome outcome() const { return outcome_; }

  // The number of states built by the beam search.
  int num_states() const { return num_states_; }

  // The tree of the greedy attachments with its cycles fixed, unlabelled.
  DependencyTree buildGreedyTree() const;

  // Labels the tree, with the constraints if use_constraints is set.
  // Returns false if the constraints cannot be satisfied.
  bool assignLabels(DependencyTree* tree, bool use_constraints) const;

  // The valid deprels of every token of the tree, above the score threshold
  // or else the best one.
  ScoredDeprelsList buildDeprelsMap(const DependencyTree& tree) const;

 private:
  // The tree of a beam state, none if the state is not valid.
  boost::optional<DependencyTree> buildStateTree(
      const BeamState<ArcValue>& state) const;

  boost::optional<DependencyTree> beamSearch();

  class TreeStateEvaluator : public StateEvaluator<ArcValue> {
   public:
    explicit TreeStateEvaluator(const DependencyTreeBuilder* builder)
        : builder_(builder), trees_() {}

    Real score(const BeamState<ArcValue>& state) const override;

    bool is_valid(const BeamState<ArcValue>& state) const override;

    // The tree of a state, built once per state id.
    const boost::optional<DependencyTree>& tree(
        const BeamState<ArcValue>& state) const;

   private:
    const DependencyTreeBuilder* builder_;
    mutable std::map<int, boost::optional<DependencyTree>> trees_;
  };

  const ParsingSentence& sentence_;
  const ArcScores& scores_;
  boost::shared_ptr<ModelConfig> config_;
  const DeprelLabeler* labeler_;
  const ConstraintList* constraints_;
  PassThroughDeprelSelector default_selector_;
  const MorphoDeprelSelector* selector_;
  BuildOutcome outcome_;
  int num_states_;
};

}  // namespace lhrtree

#endif
