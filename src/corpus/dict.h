#ifndef _CORPUS_DICT_H_
#define _CORPUS_DICT_H_

#include <string>
#include <iostream>
#include <vector>
#include <map>

#include <boost/serialization/map.hpp>
#include <boost/serialization/vector.hpp>
#include <boost/serialization/string.hpp>

#include "corpus/utils.h"

namespace lhrtree {

// Vocabularies of word forms, POS tags and deprel labels. Index 0 of every
// vocabulary is reserved for <null>, which is also what a frozen dictionary
// returns for unseen strings.
class Dict {
 public:
  Dict();

  WordId convert(const Word& word, bool frozen);

  WordId convertTag(const Word& tag, bool frozen);

  WordId convertLabel(const Word& label, bool frozen);

  Word lookup(WordId id) const;

  Word lookupTag(WordId id) const;

  Word lookupLabel(WordId id) const;

  bool punctTag(WordId id) const;

  WordId null() const { return 0; }

  size_t size() const { return words_.size(); }

  size_t tag_size() const { return tags_.size(); }

  size_t label_size() const { return labels_.size(); }

  bool valid(const WordId id) const { return (id >= 0); }

  static bool is_ws(char x) { return (x == ' ' || x == '\t'); }

  bool operator==(const Dict& other) const {
    return (words_ == other.words_ && tags_ == other.tags_ &&
            labels_ == other.labels_);
  }

  friend class boost::serialization::access;

  template<class Archive>
  void serialize(Archive & ar, const unsigned int version) {
    ar & b0_;
    ar & null_;
    ar & words_;
    ar & d_;
    ar & tags_;
    ar & tag_d_;
    ar & labels_;
    ar & label_d_;
  }

 private:
  Word b0_;
  Word null_;
  std::vector<Word> words_;
  std::map<std::string, WordId> d_;
  std::vector<Word> tags_;
  std::map<std::string, WordId> tag_d_;
  std::vector<Word> labels_;
  std::map<std::string, WordId> label_d_;
};

}  // namespace lhrtree

#endif
