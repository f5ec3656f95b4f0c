#include "lhr/beam_manager.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace lhrtree {

template<class Value>
BeamManager<Value>::BeamManager(const std::vector<std::vector<Value>>& values,
                                const StateEvaluator<Value>* evaluator,
                                unsigned max_beam_size, unsigned max_fork_size,
                                unsigned max_iterations)
    : values_(values),
      evaluator_(evaluator),
      max_beam_size_(max_beam_size),
      max_fork_size_(max_fork_size),
      max_iterations_(max_iterations),
      beam_(),
      visited_(),
      expanded_(),
      built_(),
      best_(),
      num_states_(0),
      num_iterations_(0) {
  if (values_.empty()) {
    throw std::invalid_argument("The beam needs at least one position");
  }
  for (const std::vector<Value>& candidates : values_) {
    if (candidates.empty()) {
      throw std::invalid_argument(
          "Every position needs at least one candidate value");
    }
  }
  if (max_beam_size_ == 0) {
    throw std::invalid_argument("The beam size must be positive");
  }
}

template<class Value>
typename BeamManager<Value>::StatePtr BeamManager<Value>::findBestConfiguration() {
  built_.clear();
  best_.reset();
  num_states_ = 0;
  num_iterations_ = 0;

  for (unsigned width = 1; width <= max_beam_size_; ++width) {
    num_iterations_ = searchPass(width);
  }

  return best_;
}

template<class Value>
unsigned BeamManager<Value>::searchPass(unsigned width) {
  beam_.clear();
  visited_.clear();
  expanded_.clear();

  beam_.push_back(buildState(Indices(values_.size(), 0)));

  unsigned iterations = 0;
  while (iterations < max_iterations_) {
    StateList new_states;
    bool expanded = false;
    for (const StatePtr& state : beam_) {
      if (!expanded_.insert(state->id()).second) continue;
      expanded = true;
      forkState(*state, &new_states);
    }

    if (!expanded) break;
    ++iterations;
    updateBeam(new_states, width);
  }

  return iterations;
}

template<class Value>
typename BeamManager<Value>::StatePtr BeamManager<Value>::buildState(
    const Indices& choice) {
  visited_.insert(choice);

  auto built = built_.find(choice);
  if (built != built_.end()) return built->second;

  std::vector<StateElement<Value>> elements;
  for (WordIndex p = 0; p < static_cast<WordIndex>(choice.size()); ++p) {
    elements.push_back(
        StateElement<Value>(p, choice[p], values_[p][choice[p]]));
  }

  StatePtr state = boost::make_shared<State>(elements, num_states_++);
  state->set_valid(evaluator_->is_valid(*state));
  state->set_score(evaluator_->score(*state));
  built_[choice] = state;
  updateBest(state);
  return state;
}

template<class Value>
void BeamManager<Value>::forkState(const State& state, StateList* new_states) {
  Indices choice = state.key();

  // Positions with a next candidate, cheapest score loss first.
  std::vector<std::pair<Real, WordIndex>> forks;
  for (WordIndex p = 0; p < static_cast<WordIndex>(choice.size()); ++p) {
    size_t next = choice[p] + 1;
    if (next < values_[p].size()) {
      forks.push_back(std::make_pair(
          values_[p][choice[p]].score - values_[p][next].score, p));
    }
  }
  std::sort(forks.begin(), forks.end());

  unsigned forked = 0;
  for (auto f = forks.begin(); (f != forks.end()) && (forked < max_fork_size_);
       ++f) {
    Indices fork_choice = choice;
    ++fork_choice[f->second];
    if (visited_.count(fork_choice) > 0) continue;

    new_states->push_back(buildState(fork_choice));
    ++forked;
  }
}

template<class Value>
void BeamManager<Value>::updateBeam(const StateList& new_states,
                                    unsigned width) {
  beam_.insert(beam_.end(), new_states.begin(), new_states.end());
  std::sort(beam_.begin(), beam_.end(), State::cmp_states);
  if (beam_.size() > width) beam_.resize(width);
}

template<class Value>
void BeamManager<Value>::updateBest(const StatePtr& state) {
  if (!state->valid()) return;
  if (!best_ || State::cmp_states(state, best_)) best_ = state;
}

template class BeamManager<ArcValue>;

}  // namespace lhrtree
