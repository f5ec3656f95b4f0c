#include "lhr/dependency_tree_builder.h"

#include <utility>

namespace lhrtree {

DependencyTreeBuilder::DependencyTreeBuilder(
    const ParsingSentence& sentence, const ArcScores& scores,
    const boost::shared_ptr<ModelConfig>& config,
    const DeprelLabeler* labeler, const ConstraintList* constraints,
    const MorphoDeprelSelector* selector)
    : sentence_(sentence),
      scores_(scores),
      config_(config),
      labeler_(labeler),
      constraints_(constraints),
      default_selector_(),
      selector_(selector != nullptr ? selector : &default_selector_),
      outcome_(BuildOutcome::none),
      num_states_(0) {
  if (sentence.size() != scores.size()) {
    throw std::invalid_argument(
        "The arc scores do not match the size of the sentence");
  }
}

boost::optional<DependencyTree> DependencyTreeBuilder::build() {
  boost::optional<DependencyTree> tree = beamSearch();
  if (tree) {
    outcome_ = BuildOutcome::beam;
    return tree;
  }

  if (config_->verbose) {
    std::cerr << "Sentence " << sentence_.id()
              << ": no valid tree from beam search" << std::endl;
  }

  DependencyTree fallback = buildGreedyTree();
  outcome_ = BuildOutcome::repaired;

  if ((labeler_ != nullptr) && !assignLabels(&fallback, true)) {
    if (config_->strict_constraints) {
      outcome_ = BuildOutcome::failed;
      return boost::none;
    }
    if (config_->verbose) {
      std::cerr << "Sentence " << sentence_.id()
                << ": constraints ignored" << std::endl;
    }
    assignLabels(&fallback, false);
    outcome_ = BuildOutcome::unconstrained;
  }

  return fallback;
}

boost::optional<DependencyTree> DependencyTreeBuilder::beamSearch() {
  std::vector<ArcValues> values(scores_.size());
  for (WordIndex i = 0; i < static_cast<WordIndex>(scores_.size()); ++i) {
    for (const ScoredHead& head : scores_.sorted_heads(i)) {
      values[i].push_back(ArcValue(i, head.governor, head.score));
    }
  }

  TreeStateEvaluator evaluator(this);
  BeamManager<ArcValue> beam(values, &evaluator, config_->max_beam_size,
                             config_->max_fork_size, config_->max_iterations);
  BeamManager<ArcValue>::StatePtr best = beam.findBestConfiguration();
  num_states_ = beam.num_states();

  if (!best) return boost::none;
  return evaluator.tree(*best);
}

boost::optional<DependencyTree> DependencyTreeBuilder::buildStateTree(
    const BeamState<ArcValue>& state) const {
  DependencyTree tree(sentence_.size());

  try {
    for (const StateElement<ArcValue>& element : state.elements()) {
      const ArcValue& arc = element.value;
      if (arc.governor != kRootId) {
        tree.set_arc(arc.dependent, arc.governor, kNoLabel, arc.score);
      } else {
        tree.set_attachment_score(arc.dependent, arc.score);
      }
    }
  } catch (const CycleDetectedError&) {
    return boost::none;
  }

  if (config_->single_root && !tree.has_single_root()) return boost::none;

  if ((labeler_ != nullptr) && !assignLabels(&tree, true)) return boost::none;

  return tree;
}

DependencyTree DependencyTreeBuilder::buildGreedyTree() const {
  DependencyTree tree(sentence_.size());

  std::pair<WordIndex, Real> top = scores_.highest_scoring_top();
  tree.set_attachment_score(top.first, top.second);

  Indices except(1, kRootId);
  for (WordIndex i = 0; i < static_cast<WordIndex>(tree.size()); ++i) {
    if (i == top.first) continue;

    boost::optional<ScoredHead> head = scores_.highest_scoring_head(i, except);
    if (head) {
      tree.set_arc(i, head->governor, kNoLabel, head->score, true);
    } else {
      tree.set_attachment_score(i, scores_.root_score(i));
    }
  }

  CyclesFixer fixer(&tree, scores_);
  fixer.fixCycles();
  if (config_->single_root) fixer.fixRoots();

  return tree;
}

bool DependencyTreeBuilder::assignLabels(DependencyTree* tree,
                                         bool use_constraints) const {
  ScoredDeprelsList deprels = buildDeprelsMap(*tree);

  if (use_constraints && (constraints_ != nullptr)) {
    DeprelConstraintSolver solver(sentence_, tree, *constraints_, *selector_,
                                  deprels, config_->solver_max_steps);
    try {
      solver.solve();
    } catch (const InvalidConfiguration& e) {
      if (config_->verbose) {
        std::cerr << "Sentence " << sentence_.id() << ": " << e.what()
                  << std::endl;
      }
      return false;
    }
    return true;
  }

  for (WordIndex i = 0; i < static_cast<WordIndex>(tree->size()); ++i) {
    if (deprels[i].empty()) continue;

    const ScoredDeprel& best = deprels[i].front();
    tree->set_deprel(i, best.label, best.score);
    Morphologies morphologies =
        selector_->validMorphologies(sentence_, i, best.label);
    if (!morphologies.empty()) {
      tree->set_configuration(i, morphologies.front());
    }
  }

  return true;
}

ScoredDeprelsList DependencyTreeBuilder::buildDeprelsMap(
    const DependencyTree& tree) const {
  if (labeler_ == nullptr) {
    throw std::logic_error("Cannot build deprels without a labeler");
  }
  ScoredDeprelsList predictions = labeler_->predict(tree);

  ScoredDeprelsList deprels(tree.size());
  for (WordIndex i = 0; i < static_cast<WordIndex>(tree.size()); ++i) {
    ScoredDeprels valid = selector_->validDeprels(predictions.at(i), sentence_,
                                                  i, tree.head_at(i));
    for (const ScoredDeprel& deprel : valid) {
      if (deprel.score >= config_->deprel_score_threshold) {
        deprels[i].push_back(deprel);
      }
    }

    if (deprels[i].empty()) {
      if (!valid.empty()) {
        deprels[i].push_back(valid.front());
      } else if (!predictions[i].empty()) {
        deprels[i].push_back(predictions[i].front());
      }
    }
  }

  return deprels;
}

Real DependencyTreeBuilder::TreeStateEvaluator::score(
    const BeamState<ArcValue>& state) const {
  const boost::optional<DependencyTree>& state_tree = tree(state);
  if (state_tree) return state_tree->score();

  Real score = 0;
  for (const StateElement<ArcValue>& element : state.elements()) {
    score += element.value.score;
  }
  return score;
}

bool DependencyTreeBuilder::TreeStateEvaluator::is_valid(
    const BeamState<ArcValue>& state) const {
  return static_cast<bool>(tree(state));
}

const boost::optional<DependencyTree>&
DependencyTreeBuilder::TreeStateEvaluator::tree(
    const BeamState<ArcValue>& state) const {
  auto cached = trees_.find(state.id());
  if (cached == trees_.end()) {
    cached = trees_.insert(
        std::make_pair(state.id(), builder_->buildStateTree(state))).first;
  }

  return cached->second;
}

}  // namespace lhrtree
