#ifndef _LHR_BEAM_MANAGER_H_
#define _LHR_BEAM_MANAGER_H_

#include <map>
#include <set>

#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>

#include "lhr/utils.h"

namespace lhrtree {

// One position of a state, using the index-th candidate value of its position.
template<class Value>
struct StateElement {
  StateElement(WordIndex position, int index, const Value& value)
      : position(position), index(index), value(value) {}

  WordIndex position;
  int index;
  Value value;
};

// A complete configuration: one candidate value per position.
template<class Value>
class BeamState {
 public:
  BeamState(const std::vector<StateElement<Value>>& elements, int id)
      : elements_(elements), id_(id), score_(0), valid_(false) {}

  const std::vector<StateElement<Value>>& elements() const {
    return elements_;
  }

  // Canonical key: the chosen candidate index of every position.
  Indices key() const {
    Indices key;
    for (const StateElement<Value>& element : elements_) {
      key.push_back(element.index);
    }
    return key;
  }

  int id() const { return id_; }

  Real score() const { return score_; }

  bool valid() const { return valid_; }

  void set_score(Real score) { score_ = score; }

  void set_valid(bool valid) { valid_ = valid; }

  // Valid states first, then by descending score, then by creation order.
  static bool cmp_states(const boost::shared_ptr<BeamState>& s1,
                         const boost::shared_ptr<BeamState>& s2) {
    if (s1->valid() != s2->valid()) return s1->valid();
    if (s1->score() != s2->score()) return (s1->score() > s2->score());
    return (s1->id() < s2->id());
  }

 private:
  std::vector<StateElement<Value>> elements_;
  int id_;
  Real score_;
  bool valid_;
};

// Domain strategy scoring and validating the states of a BeamManager.
template<class Value>
class StateEvaluator {
 public:
  virtual ~StateEvaluator() {}

  virtual Real score(const BeamState<Value>& state) const = 0;

  virtual bool is_valid(const BeamState<Value>& state) const = 0;
};

// Beam search over the combinations of per-position candidate values. The
// candidates of every position must be sorted by descending score; the Value
// type must expose a score member.
//
// A pass starts from the state of the best candidates. At every iteration
// each state of the beam not yet expanded is forked into at most
// max_fork_size new states, advancing a single position to its next
// candidate (positions losing the least score first). A combination is
// visited at most once per pass. The beam keeps the best states of the pass
// width.
//
// The search runs a pass of every width from 1 to max_beam_size and returns
// the best valid state built by any of them. A combination is evaluated only
// once over all passes. The result never gets worse with a larger beam or
// more iterations.
template<class Value>
class BeamManager {
 public:
  typedef BeamState<Value> State;
  typedef boost::shared_ptr<State> StatePtr;
  typedef std::vector<StatePtr> StateList;

  BeamManager(const std::vector<std::vector<Value>>& values,
              const StateEvaluator<Value>* evaluator, unsigned max_beam_size,
              unsigned max_fork_size, unsigned max_iterations);

  // The best valid state found, null if no valid state was found.
  StatePtr findBestConfiguration();

  // The number of distinct states evaluated by the last search.
  int num_states() const { return num_states_; }

  // The number of iterations run by the widest pass of the last search.
  unsigned num_iterations() const { return num_iterations_; }

  // The beam left by the widest pass of the last search.
  const StateList& beam() const { return beam_; }

 private:
  // Runs a pass with the given beam width, returns its number of iterations.
  unsigned searchPass(unsigned width);

  StatePtr buildState(const Indices& choice);

  void forkState(const State& state, StateList* new_states);

  void updateBeam(const StateList& new_states, unsigned width);

  void updateBest(const StatePtr& state);

  std::vector<std::vector<Value>> values_;
  const StateEvaluator<Value>* evaluator_;
  unsigned max_beam_size_;
  unsigned max_fork_size_;
  unsigned max_iterations_;
  StateList beam_;
  std::set<Indices> visited_;
  std::set<int> expanded_;
  std::map<Indices, StatePtr> built_;
  StatePtr best_;
  int num_states_;
  unsigned num_iterations_;
};

}  // namespace lhrtree

#endif
