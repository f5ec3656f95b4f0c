#include "lhr/cycles_fixer.h"

#include <algorithm>

namespace lhrtree {

CyclesFixer::CyclesFixer(DependencyTree* tree, const ArcScores& scores)
    : tree_(tree), scores_(scores) {}

int CyclesFixer::fixCycles() {
  int repaired = 0;
  IndicesList cycles = tree_->cycles();

  // Every repair removes a cycle without closing a new one.
  while (!cycles.empty()) {
    fixCycle(cycles.front());
    ++repaired;
    cycles = tree_->cycles();
  }

  return repaired;
}

void CyclesFixer::fixCycle(const Indices& cycle) {
  WordIndex best_dependent = kRootId;
  ScoredHead best_head;
  Real best_penalty = 0;

  for (WordIndex i : cycle) {
    boost::optional<ScoredHead> alternative = bestAlternative(i);
    if (!alternative) continue;

    Real penalty = tree_->attachment_score_at(i) - alternative->score;
    if ((best_dependent == kRootId) || (penalty < best_penalty)) {
      best_dependent = i;
      best_head = *alternative;
      best_penalty = penalty;
    }
  }

  if (best_dependent != kRootId) {
    tree_->set_arc(best_dependent, best_head.governor,
                   tree_->label_at(best_dependent), best_head.score);
    return;
  }

  // No token of the cycle can move elsewhere: detach the most likely top.
  WordIndex top = cycle.front();
  for (WordIndex i : cycle) {
    if (scores_.root_score(i) > scores_.root_score(top)) top = i;
  }
  tree_->set_attachment_score(top, scores_.root_score(top));
}

int CyclesFixer::fixRoots() {
  int moved = 0;

  while (tree_->root_count() > 1) {
    WordIndex best_dependent = kRootId;
    ScoredHead best_head;
    Real best_penalty = 0;

    for (WordIndex i = 0; i < static_cast<WordIndex>(tree_->size()); ++i) {
      if (tree_->has_head_at(i)) continue;

      boost::optional<ScoredHead> alternative = bestAlternative(i);
      if (!alternative) continue;

      Real penalty = tree_->attachment_score_at(i) - alternative->score;
      if ((best_dependent == kRootId) || (penalty < best_penalty)) {
        best_dependent = i;
        best_head = *alternative;
        best_penalty = penalty;
      }
    }

    if (best_dependent == kRootId) {
      if (regrowTree()) ++moved;
      break;
    }

    tree_->set_arc(best_dependent, best_head.governor,
                   tree_->label_at(best_dependent), best_head.score);
    ++moved;
  }

  return moved;
}

bool CyclesFixer::regrowTree() {
  WordIndex n = static_cast<WordIndex>(tree_->size());
  Indices tops;
  for (WordIndex i = 0; i < n; ++i) tops.push_back(i);
  std::stable_sort(tops.begin(), tops.end(),
                   [this](WordIndex i1, WordIndex i2) {
                     return scores_.root_score(i1) > scores_.root_score(i2);
                   });

  boost::optional<DependencyTree> best;
  for (WordIndex top : tops) {
    boost::optional<DependencyTree> tree = growTree(top);
    if (tree && (!best || (tree->score() > best->score()))) best = tree;
  }

  if (!best) return false;
  *tree_ = *best;
  return true;
}

boost::optional<DependencyTree> CyclesFixer::growTree(WordIndex top) const {
  WordIndex n = static_cast<WordIndex>(tree_->size());
  DependencyTree tree(n);
  std::vector<bool> reached(n, false);
  tree.set_attachment_score(top, scores_.root_score(top));
  reached[top] = true;

  for (WordIndex added = 1; added < n; ++added) {
    WordIndex best_dependent = kRootId;
    ScoredHead best_head;

    for (WordIndex i = 0; i < n; ++i) {
      if (reached[i]) continue;

      for (const ScoredHead& head : scores_.sorted_heads(i)) {
        if ((head.governor == kRootId) || !reached[head.governor]) continue;
        if ((best_dependent == kRootId) || (head.score > best_head.score)) {
          best_dependent = i;
          best_head = head;
        }
        break;
      }
    }

    if (best_dependent == kRootId) return boost::none;
    tree.set_arc(best_dependent, best_head.governor, kNoLabel,
                 best_head.score);
    reached[best_dependent] = true;
  }

  return tree;
}

boost::optional<ScoredHead> CyclesFixer::bestAlternative(WordIndex i) const {
  for (const ScoredHead& head : scores_.sorted_heads(i)) {
    if ((head.governor == kRootId) || (head.governor == tree_->head_at(i))) {
      continue;
    }
    if (!tree_->would_create_cycle(i, head.governor)) return head;
  }

  return boost::none;
}

}  // namespace lhrtree
