#include "lhr/morpho_deprel_selector.h"

namespace lhrtree {

CompositeDeprelSelector::CompositeDeprelSelector(
    const boost::shared_ptr<Dict>& dict)
    : dict_(dict) {}

ScoredDeprels CompositeDeprelSelector::validDeprels(
    const ScoredDeprels& deprels, const ParsingSentence& sentence,
    WordIndex token, WordIndex head) const {
  if (sentence.morphologies_at(token).empty()) return deprels;

  ScoredDeprels valid;
  for (const ScoredDeprel& deprel : deprels) {
    if (!validMorphologies(sentence, token, deprel.label).empty()) {
      valid.push_back(deprel);
    }
  }

  return valid;
}

Morphologies CompositeDeprelSelector::validMorphologies(
    const ParsingSentence& sentence, WordIndex token, WordId deprel) const {
  Words pos_tags = extractPosTags(deprel);

  Morphologies valid;
  for (const Morphology& morphology : sentence.morphologies_at(token)) {
    if (morphology == pos_tags) valid.push_back(morphology);
  }

  return valid;
}

Words CompositeDeprelSelector::extractPosTags(WordId deprel) const {
  Words pos_tags;
  for (const std::string& component :
       split_string(dict_->lookupLabel(deprel), ' ')) {
    if (component.empty()) continue;
    std::string pos = component.substr(0, component.find('~'));
    pos_tags.push_back(dict_->convertTag(pos, true));
  }

  return pos_tags;
}

}  // namespace lhrtree
