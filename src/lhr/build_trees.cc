#include <fstream>
#include <stdexcept>
#include <string>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/program_options.hpp>
#include <omp.h>

#include "corpus/dict.h"
#include "corpus/model_config.h"
#include "lhr/accuracy_counts.h"
#include "lhr/constraint.h"
#include "lhr/dependency_tree_builder.h"
#include "lhr/deprel_labeler.h"
#include "lhr/morpho_deprel_selector.h"
#include "lhr/scored_corpus.h"

using namespace boost::program_options;
using namespace lhrtree;

namespace {

unsigned positiveOption(const variables_map& vm, const std::string& name) {
  int value = vm[name].as<int>();
  if (value <= 0) {
    throw std::invalid_argument("--" + name + " must be positive");
  }
  return static_cast<unsigned>(value);
}

void loadDict(const std::string& filename, const boost::shared_ptr<Dict>& dict) {
  std::cerr << "Loading vocabulary from " << filename << "..." << std::endl;
  std::ifstream fin(filename, std::ios::in | std::ios::binary);
  if (!fin) throw std::runtime_error("Cannot open " + filename);
  boost::archive::binary_iarchive iar(fin);
  iar >> *dict;
}

void saveDict(const std::string& filename, const boost::shared_ptr<Dict>& dict) {
  std::cerr << "Writing vocabulary to " << filename << "..." << std::endl;
  std::ofstream fout(filename, std::ios::out | std::ios::binary);
  if (!fout) throw std::runtime_error("Cannot open " + filename);
  boost::archive::binary_oarchive oar(fout);
  oar << *dict;
}

void buildTrees(const boost::shared_ptr<ModelConfig>& config) {
  boost::shared_ptr<Dict> dict = boost::make_shared<Dict>();
  if (!config->dict_input_file.empty()) {
    loadDict(config->dict_input_file, dict);
  }

  ConstraintList constraints;
  if (!config->constraints_file.empty()) {
    constraints = readConstraintsFile(config->constraints_file, dict);
  }

  ScoredCorpus corpus;
  corpus.readFile(config->scores_file, dict, false);
  std::cerr << "Sentences: " << corpus.size() << " Tokens: "
            << corpus.numTokens() << std::endl;

  if (!config->dict_output_file.empty()) {
    saveDict(config->dict_output_file, dict);
  }

  boost::shared_ptr<MorphoDeprelSelector> selector;
  if (config->composite_deprels) {
    selector = boost::make_shared<CompositeDeprelSelector>(dict);
  } else {
    selector = boost::make_shared<PassThroughDeprelSelector>();
  }
  const ConstraintList* sentence_constraints =
      constraints.empty() ? nullptr : &constraints;

  std::vector<boost::optional<DependencyTree>> trees(corpus.size());
  std::vector<BuildOutcome> outcomes(corpus.size(), BuildOutcome::none);
  std::vector<std::string> errors(corpus.size());
  auto build_start = get_time();

  omp_set_num_threads(config->threads);
  #pragma omp parallel for schedule(dynamic)
  for (int j = 0; j < static_cast<int>(corpus.size()); ++j) {
    // Exceptions cannot leave the parallel region.
    try {
      StaticDeprelLabeler labeler(corpus.deprels_at(j));
      DependencyTreeBuilder builder(
          corpus.sentence_at(j), corpus.scores_at(j), config,
          corpus.has_deprels_at(j) ? &labeler : nullptr,
          sentence_constraints, selector.get());
      trees[j] = builder.build();
      outcomes[j] = builder.outcome();
    } catch (const std::exception& e) {
      errors[j] = e.what();
    }
  }

  for (unsigned j = 0; j < corpus.size(); ++j) {
    if (!errors[j].empty()) {
      throw std::runtime_error("Sentence " +
                               std::to_string(corpus.sentence_at(j).id()) +
                               ": " + errors[j]);
    }
  }

  auto build_stop = get_time();
  std::cerr << "Built trees in " << get_duration(build_start, build_stop)
            << " seconds" << std::endl;

  std::ofstream fout;
  if (!config->output_file.empty()) {
    fout.open(config->output_file);
    if (!fout) throw std::runtime_error("Cannot open " + config->output_file);
  }
  std::ostream& out = config->output_file.empty() ? std::cout : fout;

  AccuracyCounts acc_counts(dict);
  int num_beam = 0;
  int num_repaired = 0;
  int num_unconstrained = 0;
  int num_failed = 0;
  for (unsigned j = 0; j < corpus.size(); ++j) {
    const ParsingSentence& sentence = corpus.sentence_at(j);
    switch (outcomes[j]) {
      case BuildOutcome::beam: ++num_beam; break;
      case BuildOutcome::repaired: ++num_repaired; break;
      case BuildOutcome::unconstrained: ++num_unconstrained; break;
      default: ++num_failed; break;
    }

    if (!trees[j]) {
      std::cerr << "Sentence " << sentence.id()
                << ": no tree satisfies the constraints" << std::endl;
      // Keeps the output aligned with the input, every token on the root.
      out << conllString(sentence, DependencyTree(sentence.size()), *dict)
          << "\n";
      if (sentence.has_gold_arcs()) acc_counts.countFailure(sentence);
      continue;
    }

    out << conllString(sentence, *trees[j], *dict) << "\n";
    if (sentence.has_gold_arcs()) {
      acc_counts.countAccuracy(*trees[j], sentence);
    }
  }

  std::cerr << "Beam search trees: " << num_beam << std::endl;
  std::cerr << "Repaired trees: " << num_repaired << std::endl;
  std::cerr << "Unconstrained trees: " << num_unconstrained << std::endl;
  std::cerr << "Failed sentences: " << num_failed << std::endl;

  if (acc_counts.num_sentences() > 0) {
    acc_counts.printAccuracy();
  }
}

}  // namespace

int main(int argc, char** argv) {
  options_description cmdline_specific("Command line specific options");
  cmdline_specific.add_options()
    ("help,h", "print help message")
    ("config,c", value<std::string>(),
        "Config file specifying additional command line options");

  options_description generic("Allowed options");
  generic.add_options()
    ("scores-file,i", value<std::string>(),
        "corpus of scored sentences")
    ("constraints-file", value<std::string>(),
        "linguistic constraints on the deprels")
    ("output-file,o", value<std::string>(),
        "conll output file, standard output if missing")
    ("dict-in", value<std::string>(),
        "Load the vocabulary from this file")
    ("dict-out", value<std::string>(),
        "Save the vocabulary to this file")
    ("beam-size", value<int>()->default_value(10),
        "Maximum number of states in the beam.")
    ("fork-size", value<int>()->default_value(5),
        "Maximum number of new states forked from one state.")
    ("iterations", value<int>()->default_value(10),
        "Maximum number of beam search iterations.")
    ("deprel-threshold", value<double>()->default_value(0.0),
        "Minimum score of the deprels considered for labelling.")
    ("single-root", value<bool>()->default_value(true),
        "Only accept trees with exactly one token on the root.")
    ("strict-constraints", value<bool>()->default_value(false),
        "Give up on sentences whose constraints cannot be satisfied.")
    ("composite-deprels", value<bool>()->default_value(false),
        "Deprels annotate the POS of the analyses (POS~REL).")
    ("solver-max-steps", value<int>()->default_value(10000),
        "Maximum number of choices tried by the constraint solver.")
    ("threads", value<int>()->default_value(1),
        "number of worker threads.")
    ("verbose", value<bool>()->default_value(false),
        "Report the fallbacks of every sentence.");
  options_description config_options, cmdline_options;
  config_options.add(generic);
  cmdline_options.add(generic).add(cmdline_specific);

  try {
    variables_map vm;
    store(parse_command_line(argc, argv, cmdline_options), vm);
    if (vm.count("config") > 0) {
      std::ifstream config(vm["config"].as<std::string>().c_str());
      store(parse_config_file(config, config_options), vm);
    }

    if (vm.count("help") || !vm.count("scores-file")) {
      std::cerr << cmdline_options << "\n";
      return 1;
    }

    notify(vm);

    boost::shared_ptr<ModelConfig> config = boost::make_shared<ModelConfig>();
    config->scores_file = vm["scores-file"].as<std::string>();
    if (vm.count("constraints-file")) {
      config->constraints_file = vm["constraints-file"].as<std::string>();
    }
    if (vm.count("output-file")) {
      config->output_file = vm["output-file"].as<std::string>();
    }
    if (vm.count("dict-in")) {
      config->dict_input_file = vm["dict-in"].as<std::string>();
    }
    if (vm.count("dict-out")) {
      config->dict_output_file = vm["dict-out"].as<std::string>();
    }

    config->max_beam_size = positiveOption(vm, "beam-size");
    config->max_fork_size = positiveOption(vm, "fork-size");
    if (vm["iterations"].as<int>() < 0) {
      throw std::invalid_argument("--iterations must not be negative");
    }
    config->max_iterations = vm["iterations"].as<int>();
    config->deprel_score_threshold = vm["deprel-threshold"].as<double>();
    config->single_root = vm["single-root"].as<bool>();
    config->strict_constraints = vm["strict-constraints"].as<bool>();
    config->composite_deprels = vm["composite-deprels"].as<bool>();
    config->solver_max_steps = vm["solver-max-steps"].as<int>();
    config->threads = vm["threads"].as<int>();
    config->verbose = vm["verbose"].as<bool>();

    config->check();
    config->print(std::cerr);
    buildTrees(config);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
