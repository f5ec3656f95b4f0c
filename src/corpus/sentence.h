#ifndef _CORPUS_SENT_H_
#define _CORPUS_SENT_H_

#include "corpus/dict.h"

namespace lhrtree {

// Class that represent a sentence (a sequence of words).
class Sentence {
 public:
  Sentence();

  Sentence(Words sent, int id);

  virtual ~Sentence() {}

  int id() const { return id_; }

  virtual size_t size() const { return sentence_.size(); }

  WordId word_at(WordIndex i) const { return sentence_.at(i); }

 private:
  Words sentence_;
  int id_;
};

}  // namespace lhrtree

#endif
