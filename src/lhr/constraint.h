#ifndef _LHR_CONSTRAINT_H_
#define _LHR_CONSTRAINT_H_

#include <string>

#include "corpus/dict.h"
#include "corpus/parsing_sentence.h"
#include "lhr/utils.h"

namespace lhrtree {

// The morpho-syntactic view of a token on which constraints are verified.
struct MorphoSynToken {
  MorphoSynToken() : id(kRootId), head(kRootId), deprel(kNoLabel) {}

  MorphoSynToken(WordIndex id, WordIndex head, WordId deprel,
                 const Morphology& configuration)
      : id(id), head(head), deprel(deprel), configuration(configuration) {}

  WordIndex id;
  WordIndex head;
  WordId deprel;
  Morphology configuration;
};

// A conjunction of (possibly negated) conditions on the deprel and the POS of
// a token. The empty pattern matches any token.
class TokenPattern {
 public:
  enum class Field { deprel, pos };

  struct Condition {
    Field field;
    WordId value;
    bool negated;
  };

  void add_condition(Field field, WordId value, bool negated) {
    conditions_.push_back(Condition{field, value, negated});
  }

  bool empty() const { return conditions_.empty(); }

  bool matches(const MorphoSynToken& token) const;

 private:
  std::vector<Condition> conditions_;
};

// A linguistic constraint verified on a token and, possibly, its governor.
class Constraint {
 public:
  Constraint(const std::string& name, const TokenPattern& premise,
             const TokenPattern& conclusion)
      : name_(name), premise_(premise), conclusion_(conclusion) {}

  virtual ~Constraint() {}

  const std::string& name() const { return name_; }

  // The governor is null for the top of the tree.
  virtual bool is_verified(const MorphoSynToken& token,
                           const MorphoSynToken* governor) const = 0;

 protected:
  std::string name_;
  TokenPattern premise_;
  TokenPattern conclusion_;
};

// premise(token) => conclusion(token)
class SingleConstraint : public Constraint {
 public:
  SingleConstraint(const std::string& name, const TokenPattern& premise,
                   const TokenPattern& conclusion)
      : Constraint(name, premise, conclusion) {}

  bool is_verified(const MorphoSynToken& token,
                   const MorphoSynToken* governor) const override;
};

// premise(token) => conclusion(governor). The root governor has neither deprel
// nor POS, so only negated conditions hold on it.
class GovernorConstraint : public Constraint {
 public:
  GovernorConstraint(const std::string& name, const TokenPattern& premise,
                     const TokenPattern& conclusion)
      : Constraint(name, premise, conclusion) {}

  bool is_verified(const MorphoSynToken& token,
                   const MorphoSynToken* governor) const override;
};

typedef std::vector<boost::shared_ptr<Constraint>> ConstraintList;

// Parses "NAME single|governor PREMISE => CONCLUSION", where the patterns are
// comma separated deprel=X / pos=Y items, optionally prefixed by '!'.
boost::shared_ptr<Constraint> parseConstraint(
    const std::string& line, const boost::shared_ptr<Dict>& dict);

ConstraintList readConstraintsFile(const std::string& filename,
                                   const boost::shared_ptr<Dict>& dict);

}  // namespace lhrtree

#endif
