#include "corpus/model_config.h"

#include <stdexcept>

namespace lhrtree {

ModelConfig::ModelConfig()
    : max_beam_size(10), max_fork_size(5), max_iterations(10),
      deprel_score_threshold(0), single_root(true), strict_constraints(false),
      composite_deprels(false), solver_max_steps(10000), threads(1),
      verbose(false) {}

void ModelConfig::check() const {
  if (max_beam_size == 0) {
    throw std::invalid_argument("The beam size must be positive");
  }
  if (max_fork_size == 0) {
    throw std::invalid_argument("The fork size must be positive");
  }
  if (solver_max_steps <= 0) {
    throw std::invalid_argument("The solver steps must be positive");
  }
  if (threads <= 0) {
    throw std::invalid_argument("The number of threads must be positive");
  }
}

void ModelConfig::print(std::ostream& out) const {
  out << "################################" << std::endl;
  out << "# Scores file: " << scores_file << std::endl;
  if (!constraints_file.empty()) {
    out << "# Constraints file: " << constraints_file << std::endl;
  }
  out << "# Beam size: " << max_beam_size << std::endl;
  out << "# Fork size: " << max_fork_size << std::endl;
  out << "# Iterations: " << max_iterations << std::endl;
  out << "# Deprel score threshold: " << deprel_score_threshold << std::endl;
  out << "# Single root: " << single_root << std::endl;
  out << "# Strict constraints: " << strict_constraints << std::endl;
  out << "# Composite deprels: " << composite_deprels << std::endl;
  out << "# Solver max steps: " << solver_max_steps << std::endl;
  out << "# Threads: " << threads << std::endl;
  out << "################################" << std::endl;
}

}  // namespace lhrtree
