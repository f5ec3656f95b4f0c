#include "corpus/dict.h"

namespace lhrtree {

Dict::Dict() : b0_("<unk>"), null_("<null>") {
  words_.reserve(1000);
  convert(null_, false);
  convertTag(null_, false);
  convertLabel(null_, false);
}

WordId Dict::convert(const Word& word, bool frozen) {
  auto i = d_.find(word);
  if (i == d_.end()) {
    if (frozen) return 0;
    words_.push_back(word);
    d_[word] = words_.size() - 1;
    return words_.size() - 1;
  } else {
    return i->second;
  }
}

WordId Dict::convertTag(const Word& tag, bool frozen) {
  auto i = tag_d_.find(tag);
  if (i == tag_d_.end()) {
    if (frozen) return 0;
    tags_.push_back(tag);
    tag_d_[tag] = tags_.size() - 1;
    return tags_.size() - 1;
  } else {
    return i->second;
  }
}

WordId Dict::convertLabel(const Word& label, bool frozen) {
  auto i = label_d_.find(label);
  if (i == label_d_.end()) {
    if (frozen) return 0;
    labels_.push_back(label);
    label_d_[label] = labels_.size() - 1;
    return labels_.size() - 1;
  } else {
    return i->second;
  }
}

bool Dict::punctTag(WordId id) const {
  std::vector<Word> punct = {".", ",", "?", "!", ":", "''", "``", "(", ")",
                             "-LRB-", "-RRB-", "#", "$", "PU", "PUNCT"};
  Word tag = lookupTag(id);
  for (auto punc : punct) {
    if (tag == punc) return true;
  }

  return false;
}

Word Dict::lookup(WordId id) const {
  if (valid(id) && id < static_cast<WordId>(words_.size())) {
    return words_[id];
  } else {
    return b0_;
  }
}

Word Dict::lookupTag(WordId id) const {
  if (valid(id) && id < static_cast<WordId>(tags_.size())) {
    return tags_[id];
  } else {
    return b0_;
  }
}

Word Dict::lookupLabel(WordId id) const {
  if (valid(id) && id < static_cast<WordId>(labels_.size())) {
    return labels_[id];
  } else {
    return b0_;
  }
}

}  // namespace lhrtree
