#include "corpus/sentence.h"

namespace lhrtree {

Sentence::Sentence() : sentence_(), id_(0) {}

Sentence::Sentence(Words sent, int id) : sentence_(sent), id_(id) {}

}  // namespace lhrtree
