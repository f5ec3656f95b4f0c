#include "lhr/constraint.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace lhrtree {

bool TokenPattern::matches(const MorphoSynToken& token) const {
  for (const Condition& condition : conditions_) {
    bool holds;
    if (condition.field == Field::deprel) {
      holds = (token.deprel == condition.value);
    } else {
      holds = (std::find(token.configuration.begin(),
                         token.configuration.end(),
                         condition.value) != token.configuration.end());
    }
    if (holds == condition.negated) return false;
  }

  return true;
}

bool SingleConstraint::is_verified(const MorphoSynToken& token,
                                   const MorphoSynToken* governor) const {
  return (!premise_.matches(token) || conclusion_.matches(token));
}

bool GovernorConstraint::is_verified(const MorphoSynToken& token,
                                     const MorphoSynToken* governor) const {
  if (!premise_.matches(token)) return true;
  if (governor == nullptr) return conclusion_.matches(MorphoSynToken());
  return conclusion_.matches(*governor);
}

namespace {

std::string trim(const std::string& str) {
  size_t first = 0;
  while (first < str.size() && Dict::is_ws(str[first])) ++first;
  size_t last = str.size();
  while (last > first && Dict::is_ws(str[last - 1])) --last;
  return str.substr(first, last - first);
}

TokenPattern parsePattern(const std::string& str,
                          const boost::shared_ptr<Dict>& dict) {
  TokenPattern pattern;
  for (const std::string& field : split_string(str, ',')) {
    std::string item = trim(field);
    if (item.empty()) continue;

    bool negated = (item[0] == '!');
    if (negated) item = item.substr(1);

    size_t eq = item.find('=');
    if (eq == std::string::npos) {
      throw std::invalid_argument("Invalid constraint condition: " + field);
    }
    std::string key = trim(item.substr(0, eq));
    std::string value = trim(item.substr(eq + 1));
    if (key == "deprel") {
      pattern.add_condition(TokenPattern::Field::deprel,
                            dict->convertLabel(value, false), negated);
    } else if (key == "pos") {
      pattern.add_condition(TokenPattern::Field::pos,
                            dict->convertTag(value, false), negated);
    } else {
      throw std::invalid_argument("Unknown constraint field: " + key);
    }
  }

  return pattern;
}

}  // namespace

boost::shared_ptr<Constraint> parseConstraint(
    const std::string& line, const boost::shared_ptr<Dict>& dict) {
  std::istringstream in(line);
  std::string name, type;
  if (!(in >> name >> type)) {
    throw std::invalid_argument("Invalid constraint: " + line);
  }

  std::string body;
  std::getline(in, body);
  size_t arrow = body.find("=>");
  if (arrow == std::string::npos) {
    throw std::invalid_argument("Constraint without '=>': " + line);
  }
  TokenPattern premise = parsePattern(body.substr(0, arrow), dict);
  TokenPattern conclusion = parsePattern(body.substr(arrow + 2), dict);

  if (type == "single") {
    return boost::make_shared<SingleConstraint>(name, premise, conclusion);
  } else if (type == "governor") {
    return boost::make_shared<GovernorConstraint>(name, premise, conclusion);
  } else {
    throw std::invalid_argument("Unknown constraint type: " + type);
  }
}

ConstraintList readConstraintsFile(const std::string& filename,
                                   const boost::shared_ptr<Dict>& dict) {
  std::cerr << "Reading constraints from " << filename << std::endl;
  std::ifstream in(filename);
  if (!in) {
    throw std::invalid_argument("Cannot open constraints file " + filename);
  }

  ConstraintList constraints;
  std::string line;
  while (std::getline(in, line)) {
    std::string content = trim(line);
    if (content.empty() || content[0] == '#') continue;
    constraints.push_back(parseConstraint(content, dict));
  }

  std::cerr << "Read " << constraints.size() << " constraints" << std::endl;
  return constraints;
}

}  // namespace lhrtree
