#ifndef _CORPUS_MODEL_CONFIG_H_
#define _CORPUS_MODEL_CONFIG_H_

#include <string>
#include <iostream>

#include <boost/shared_ptr.hpp>

namespace lhrtree {

struct ModelConfig {
  ModelConfig();

  std::string scores_file;
  std::string constraints_file;
  std::string output_file;
  std::string dict_input_file;
  std::string dict_output_file;
  unsigned    max_beam_size;
  unsigned    max_fork_size;
  unsigned    max_iterations;
  double      deprel_score_threshold;
  bool        single_root;
  bool        strict_constraints;
  bool        composite_deprels;
  int         solver_max_steps;
  int         threads;
  bool        verbose;

  // Throws std::invalid_argument if a search limit is not positive.
  void check() const;

  void print(std::ostream& out) const;
};

}  // namespace lhrtree

#endif
