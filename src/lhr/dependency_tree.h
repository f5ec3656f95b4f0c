#ifndef _LHR_DEPENDENCY_TREE_H_
#define _LHR_DEPENDENCY_TREE_H_

#include <stdexcept>
#include <string>

#include <boost/optional.hpp>

#include "corpus/parsing_sentence.h"
#include "lhr/utils.h"

namespace lhrtree {

// Thrown when an arc would close a cycle.
class CycleDetectedError : public std::runtime_error {
 public:
  CycleDetectedError(WordIndex dependent, WordIndex governor)
      : std::runtime_error("Arc " + std::to_string(dependent) + " -> " +
                           std::to_string(governor) + " closes a cycle"),
        dependent_(dependent),
        governor_(governor) {}

  WordIndex dependent() const { return dependent_; }

  WordIndex governor() const { return governor_; }

 private:
  WordIndex dependent_;
  WordIndex governor_;
};

// The dependency tree of a sentence. Every token has at most one head; a token
// without head is attached to the virtual root.
class DependencyTree {
 public:
  explicit DependencyTree(size_t size);

  // Node i has parent j. Unless allow_cycle is set, throws CycleDetectedError
  // (leaving the tree untouched) if the arc would close a cycle.
  void set_arc(WordIndex i, WordIndex j, WordId label = kNoLabel,
               boost::optional<Real> score = boost::none,
               bool allow_cycle = false);

  // Attaches i to the root, recording its root score.
  void set_attachment_score(WordIndex i, Real score);

  void set_deprel(WordIndex i, WordId label, Real score = 0);

  void set_configuration(WordIndex i, const Morphology& configuration);

  size_t size() const { return heads_.size(); }

  WordIndex head_at(WordIndex i) const { return heads_.at(i); }

  bool has_head_at(WordIndex i) const { return (heads_.at(i) != kRootId); }

  WordId label_at(WordIndex i) const { return labels_.at(i); }

  Real label_score_at(WordIndex i) const { return label_scores_.at(i); }

  bool has_attachment_score_at(WordIndex i) const {
    return scored_.at(i);
  }

  Real attachment_score_at(WordIndex i) const {
    return attachment_scores_.at(i);
  }

  const Morphology& configuration_at(WordIndex i) const {
    return configurations_.at(i);
  }

  // Position of a token in the sentence.
  WordIndex position_at(WordIndex id) const {
    if (id < 0 || id >= static_cast<WordIndex>(size())) {
      throw std::out_of_range("No token with id " + std::to_string(id));
    }
    return id;
  }

  Indices arcs() const { return heads_; }

  bool would_create_cycle(WordIndex i, WordIndex j) const;

  size_t root_count() const;

  bool has_single_root() const { return (root_count() == 1); }

  // The first token attached to the root, kRootId if there is none.
  WordIndex root() const;

  // Every cycle sorted ascending, the cycles ordered by their first token.
  IndicesList cycles() const;

  bool is_acyclic() const { return cycles().empty(); }

  // Sum of the attachment and deprel scores.
  Real score() const;

  bool equal_arcs(const DependencyTree& tree) const {
    return (heads_ == tree.heads_);
  }

  bool operator==(const DependencyTree& tree) const {
    return (heads_ == tree.heads_ && labels_ == tree.labels_ &&
            label_scores_ == tree.label_scores_ &&
            attachment_scores_ == tree.attachment_scores_ &&
            scored_ == tree.scored_ &&
            configurations_ == tree.configurations_);
  }

 private:
  void check_token(WordIndex i) const;

  Indices heads_;
  Words labels_;
  Reals label_scores_;
  Reals attachment_scores_;
  std::vector<bool> scored_;
  std::vector<Morphology> configurations_;
};

}  // namespace lhrtree

#endif
