#include "lhr/scored_corpus.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace lhrtree {

namespace {

const std::string kEmptyField = "_";

std::invalid_argument lineError(int line_num, const std::string& message) {
  return std::invalid_argument("Line " + std::to_string(line_num) + ": " +
                               message);
}

Real toReal(const std::string& str, int line_num) {
  try {
    size_t pos = 0;
    Real value = std::stod(str, &pos);
    if (pos == str.size()) return value;
  } catch (const std::logic_error&) {
  }
  throw lineError(line_num, "invalid score '" + str + "'");
}

int toInt(const std::string& str, int line_num) {
  try {
    size_t pos = 0;
    int value = std::stoi(str, &pos);
    if (pos == str.size()) return value;
  } catch (const std::logic_error&) {
  }
  throw lineError(line_num, "invalid integer '" + str + "'");
}

// Splits "KEY:SCORE" on its last colon.
std::pair<std::string, Real> toScoredPair(const std::string& str,
                                          int line_num) {
  size_t colon = str.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    throw lineError(line_num, "expected KEY:SCORE, found '" + str + "'");
  }
  return std::make_pair(str.substr(0, colon),
                        toReal(str.substr(colon + 1), line_num));
}

}  // namespace

ScoredCorpus::ScoredCorpus()
    : sentences_(), scores_(), deprels_(), sentence_deprels_(),
      has_deprels_(false) {}

void ScoredCorpus::readFile(const std::string& filename,
                            const boost::shared_ptr<Dict>& dict, bool frozen) {
  std::cerr << "Reading from " << filename << std::endl;
  std::ifstream in(filename);
  if (!in) {
    throw std::invalid_argument("Cannot open scores file " + filename);
  }
  read(in, dict, frozen);
}

void ScoredCorpus::read(std::istream& in, const boost::shared_ptr<Dict>& dict,
                        bool frozen) {
  std::vector<TokenLine> tokens;
  std::string line;
  int line_num = 0;
  int first_line = 0;

  while (std::getline(in, line)) {
    ++line_num;
    bool blank = (line.find_first_not_of(" \t\r") == std::string::npos);
    if (blank) {
      // End of sentence.
      if (!tokens.empty()) addSentence(tokens, first_line);
      tokens.clear();
    } else {
      if (tokens.empty()) first_line = line_num;
      tokens.push_back(convertLine(line, line_num, dict, frozen));
    }
  }

  if (!tokens.empty()) addSentence(tokens, first_line);
}

ScoredCorpus::TokenLine ScoredCorpus::convertLine(
    const std::string& line, int line_num, const boost::shared_ptr<Dict>& dict,
    bool frozen) {
  std::istringstream in(line);
  std::vector<std::string> cols;
  std::string col;
  while (in >> col) cols.push_back(col);
  if (cols.size() != 8) {
    throw lineError(line_num, "expected 8 columns, found " +
                                  std::to_string(cols.size()));
  }

  TokenLine token;
  token.id = toInt(cols[0], line_num) - 1;
  token.word = dict->convert(cols[1], frozen);

  if (cols[2] != kEmptyField) {
    for (const std::string& analysis : split_string(cols[2], '|')) {
      Morphology morphology;
      for (const std::string& pos : split_string(analysis, '+')) {
        if (pos.empty()) throw lineError(line_num, "empty POS tag");
        morphology.push_back(dict->convertTag(pos, frozen));
      }
      token.morphologies.push_back(morphology);
    }
  }

  token.gold_head = (cols[3] == kEmptyField) ? -2 : toInt(cols[3], line_num) - 1;
  token.gold_label = (cols[4] == kEmptyField)
                         ? kNoLabel
                         : dict->convertLabel(cols[4], frozen);
  token.root_score = toReal(cols[5], line_num);

  if (cols[6] != kEmptyField) {
    for (const std::string& field : split_string(cols[6], ',')) {
      std::pair<std::string, Real> head = toScoredPair(field, line_num);
      token.heads.push_back(
          ScoredHead(toInt(head.first, line_num) - 1, head.second));
    }
  }

  if (cols[7] != kEmptyField) {
    for (const std::string& field : split_string(cols[7], ',')) {
      std::pair<std::string, Real> deprel = toScoredPair(field, line_num);
      token.deprels.push_back(
          ScoredDeprel(dict->convertLabel(deprel.first, frozen), deprel.second));
    }
  }

  return token;
}

void ScoredCorpus::addSentence(const std::vector<TokenLine>& tokens,
                               int first_line) {
  Words sent;
  std::vector<Morphologies> morphologies;
  Indices gold_arcs;
  Words gold_labels;
  bool gold_heads_complete = true;
  bool gold_labels_complete = true;
  std::vector<ScoredHeads> heads;
  Reals root_scores;
  ScoredDeprelsList deprels;
  bool sentence_deprels = false;

  for (WordIndex i = 0; i < static_cast<WordIndex>(tokens.size()); ++i) {
    const TokenLine& token = tokens[i];
    if (token.id != i) {
      throw lineError(first_line + i,
                      "token ids must start from 1 and be sequential");
    }
    sent.push_back(token.word);
    morphologies.push_back(token.morphologies);
    gold_arcs.push_back(token.gold_head);
    gold_labels.push_back(token.gold_label);
    if (token.gold_head == -2) gold_heads_complete = false;
    if (token.gold_label == kNoLabel) gold_labels_complete = false;
    heads.push_back(token.heads);
    root_scores.push_back(token.root_score);
    deprels.push_back(token.deprels);
    if (!token.deprels.empty()) sentence_deprels = true;
  }

  if (!gold_heads_complete) gold_arcs.clear();
  if (!gold_labels_complete) gold_labels.clear();

  int id = sentences_.size() + 1;
  try {
    sentences_.push_back(
        ParsingSentence(sent, morphologies, gold_arcs, gold_labels, id));
    scores_.push_back(boost::make_shared<ArcScores>(heads, root_scores));
  } catch (const std::invalid_argument& e) {
    throw lineError(first_line, e.what());
  }
  deprels_.push_back(deprels);
  sentence_deprels_.push_back(sentence_deprels);
  if (sentence_deprels) has_deprels_ = true;
}

size_t ScoredCorpus::numTokens() const {
  size_t total = 0;
  for (const ParsingSentence& sent : sentences_) total += sent.size();

  return total;
}

std::string conllString(const ParsingSentence& sentence,
                        const DependencyTree& tree, const Dict& dict) {
  std::ostringstream out;
  for (WordIndex i = 0; i < static_cast<WordIndex>(tree.size()); ++i) {
    std::string pos = "_";
    const Morphology& configuration = tree.configuration_at(i);
    if (!configuration.empty()) {
      pos = "";
      for (size_t k = 0; k < configuration.size(); ++k) {
        if (k > 0) pos += "+";
        pos += dict.lookupTag(configuration[k]);
      }
    } else if (sentence.first_tag_at(i) >= 0) {
      pos = dict.lookupTag(sentence.first_tag_at(i));
    }

    std::string label = "_";
    if (tree.label_at(i) != kNoLabel) label = dict.lookupLabel(tree.label_at(i));

    out << (i + 1) << "\t" << dict.lookup(sentence.word_at(i)) << "\t_\t"
        << pos << "\t_\t_\t" << (tree.head_at(i) + 1) << "\t" << label
        << "\t_\t_\n";
  }

  return out.str();
}

}  // namespace lhrtree
