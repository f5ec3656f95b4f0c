#ifndef _LHR_UTILS_H_
#define _LHR_UTILS_H_

#include <vector>

#include "corpus/utils.h"

namespace lhrtree {

// Id of the virtual root governor.
const WordIndex kRootId = -1;

// Label id of a token without deprel.
const WordId kNoLabel = -1;

struct ScoredHead {
  ScoredHead() : governor(kRootId), score(0) {}

  ScoredHead(WordIndex governor, Real score)
      : governor(governor), score(score) {}

  WordIndex governor;
  Real score;
};

typedef std::vector<ScoredHead> ScoredHeads;

struct ScoredDeprel {
  ScoredDeprel() : label(kNoLabel), score(0) {}

  ScoredDeprel(WordId label, Real score) : label(label), score(score) {}

  WordId label;
  Real score;
};

typedef std::vector<ScoredDeprel> ScoredDeprels;
typedef std::vector<ScoredDeprels> ScoredDeprelsList;

// An elementary attachment decision: dependent attaches to governor.
struct ArcValue {
  ArcValue() : dependent(0), governor(kRootId), score(0) {}

  ArcValue(WordIndex dependent, WordIndex governor, Real score)
      : dependent(dependent), governor(governor), score(score) {}

  WordIndex dependent;
  WordIndex governor;
  Real score;
};

typedef std::vector<ArcValue> ArcValues;

}  // namespace lhrtree

#endif
