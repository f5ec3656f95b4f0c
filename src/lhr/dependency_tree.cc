#include "lhr/dependency_tree.h"

#include <algorithm>

namespace lhrtree {

DependencyTree::DependencyTree(size_t size)
    : heads_(size, kRootId),
      labels_(size, kNoLabel),
      label_scores_(size, 0),
      attachment_scores_(size, 0),
      scored_(size, false),
      configurations_(size, Morphology()) {}

void DependencyTree::check_token(WordIndex i) const {
  if (i < 0 || i >= static_cast<WordIndex>(size())) {
    throw std::out_of_range("No token with id " + std::to_string(i));
  }
}

void DependencyTree::set_arc(WordIndex i, WordIndex j, WordId label,
                             boost::optional<Real> score, bool allow_cycle) {
  check_token(i);
  check_token(j);
  if (i == j) {
    throw std::invalid_argument("Token " + std::to_string(i) +
                                " cannot be its own head");
  }
  if (!allow_cycle && would_create_cycle(i, j)) {
    throw CycleDetectedError(i, j);
  }

  heads_[i] = j;
  if (label != kNoLabel) labels_[i] = label;
  if (score) {
    attachment_scores_[i] = *score;
    scored_[i] = true;
  } else {
    attachment_scores_[i] = 0;
    scored_[i] = false;
  }
}

void DependencyTree::set_attachment_score(WordIndex i, Real score) {
  check_token(i);
  heads_[i] = kRootId;
  attachment_scores_[i] = score;
  scored_[i] = true;
}

void DependencyTree::set_deprel(WordIndex i, WordId label, Real score) {
  check_token(i);
  labels_[i] = label;
  label_scores_[i] = score;
}

void DependencyTree::set_configuration(WordIndex i,
                                       const Morphology& configuration) {
  check_token(i);
  configurations_[i] = configuration;
}

bool DependencyTree::would_create_cycle(WordIndex i, WordIndex j) const {
  // Walk up from the new governor: reaching i means j is a descendant of i.
  // The walk is bounded since other cycles may already exist.
  WordIndex k = j;
  for (size_t steps = 0; (k != kRootId) && (steps <= size()); ++steps) {
    if (k == i) return true;
    k = heads_[k];
  }

  return false;
}

size_t DependencyTree::root_count() const {
  return std::count(heads_.begin(), heads_.end(), kRootId);
}

WordIndex DependencyTree::root() const {
  for (WordIndex i = 0; i < static_cast<WordIndex>(size()); ++i) {
    if (heads_[i] == kRootId) return i;
  }

  return kRootId;
}

IndicesList DependencyTree::cycles() const {
  // 0: unvisited, 1: on the current path, 2: done.
  std::vector<int> state(size(), 0);
  IndicesList cycles;

  for (WordIndex start = 0; start < static_cast<WordIndex>(size()); ++start) {
    if (state[start] != 0) continue;

    Indices path;
    WordIndex k = start;
    while ((k != kRootId) && (state[k] == 0)) {
      state[k] = 1;
      path.push_back(k);
      k = heads_[k];
    }

    if ((k != kRootId) && (state[k] == 1)) {
      Indices cycle(std::find(path.begin(), path.end(), k), path.end());
      std::sort(cycle.begin(), cycle.end());
      cycles.push_back(cycle);
    }

    for (WordIndex i : path) state[i] = 2;
  }

  std::sort(cycles.begin(), cycles.end());
  return cycles;
}

Real DependencyTree::score() const {
  Real score = 0;
  for (size_t i = 0; i < size(); ++i) {
    score += attachment_scores_[i] + label_scores_[i];
  }

  return score;
}

}  // namespace lhrtree
