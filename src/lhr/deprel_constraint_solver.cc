#include "lhr/deprel_constraint_solver.h"

#include <deque>

namespace lhrtree {

DeprelConstraintSolver::DeprelConstraintSolver(
    const ParsingSentence& sentence, DependencyTree* tree,
    const ConstraintList& constraints, const MorphoDeprelSelector& selector,
    const ScoredDeprelsList& deprels, int max_steps)
    : sentence_(sentence),
      tree_(tree),
      constraints_(constraints),
      selector_(selector),
      max_steps_(max_steps),
      steps_(0),
      choices_(),
      order_(),
      assigned_(tree->size(), -1) {
  if (sentence.size() != tree->size() || deprels.size() != tree->size()) {
    throw std::invalid_argument(
        "Sentence, tree and deprels must have the same size");
  }
  if (!tree->is_acyclic()) {
    throw std::invalid_argument("Cannot label a tree with cycles");
  }

  buildChoices(deprels);
  buildOrder();
}

void DeprelConstraintSolver::buildChoices(const ScoredDeprelsList& deprels) {
  choices_.resize(tree_->size());
  for (WordIndex i = 0; i < static_cast<WordIndex>(tree_->size()); ++i) {
    bool analysed = !sentence_.morphologies_at(i).empty();
    for (const ScoredDeprel& deprel : deprels[i]) {
      Morphologies morphologies =
          selector_.validMorphologies(sentence_, i, deprel.label);
      if (morphologies.empty() && !analysed) {
        choices_[i].push_back(Choice{deprel.label, deprel.score, Morphology()});
      }
      for (const Morphology& morphology : morphologies) {
        choices_[i].push_back(Choice{deprel.label, deprel.score, morphology});
      }
    }
  }
}

void DeprelConstraintSolver::buildOrder() {
  IndicesList children(tree_->size());
  std::deque<WordIndex> queue;
  for (WordIndex i = 0; i < static_cast<WordIndex>(tree_->size()); ++i) {
    if (tree_->has_head_at(i)) {
      children[tree_->head_at(i)].push_back(i);
    } else {
      queue.push_back(i);
    }
  }

  while (!queue.empty()) {
    WordIndex i = queue.front();
    queue.pop_front();
    order_.push_back(i);
    for (WordIndex c : children[i]) queue.push_back(c);
  }
}

void DeprelConstraintSolver::solve() {
  for (WordIndex i = 0; i < static_cast<WordIndex>(tree_->size()); ++i) {
    if (choices_[i].empty()) {
      throw InvalidConfiguration("No deprel compatible with token " +
                                 std::to_string(i));
    }
  }

  if (!search(0)) {
    throw InvalidConfiguration("No deprel configuration satisfies the constraints");
  }

  for (WordIndex i = 0; i < static_cast<WordIndex>(tree_->size()); ++i) {
    const Choice& choice = choices_[i][assigned_[i]];
    tree_->set_deprel(i, choice.deprel, choice.score);
    tree_->set_configuration(i, choice.configuration);
  }
}

bool DeprelConstraintSolver::search(size_t k) {
  if (k == order_.size()) return true;

  WordIndex i = order_[k];
  for (int c = 0; c < static_cast<int>(choices_[i].size()); ++c) {
    if (++steps_ > max_steps_) {
      throw InvalidConfiguration("Deprel search exceeded " +
                                 std::to_string(max_steps_) + " steps");
    }

    assigned_[i] = c;
    if (verified(i) && search(k + 1)) return true;
  }

  assigned_[i] = -1;
  return false;
}

bool DeprelConstraintSolver::verified(WordIndex i) const {
  MorphoSynToken token = tokenView(i);
  MorphoSynToken governor;
  bool has_governor = tree_->has_head_at(i);
  if (has_governor) governor = tokenView(tree_->head_at(i));

  for (const boost::shared_ptr<Constraint>& constraint : constraints_) {
    if (!constraint->is_verified(token, has_governor ? &governor : nullptr)) {
      return false;
    }
  }

  return true;
}

MorphoSynToken DeprelConstraintSolver::tokenView(WordIndex i) const {
  if (assigned_[i] < 0) {
    return MorphoSynToken(i, tree_->head_at(i), kNoLabel, Morphology());
  }

  const Choice& choice = choices_[i][assigned_[i]];
  return MorphoSynToken(i, tree_->head_at(i), choice.deprel,
                        choice.configuration);
}

}  // namespace lhrtree
