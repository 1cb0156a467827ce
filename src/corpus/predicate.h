#ifndef _CORPUS_PREDICATE_H_
#define _CORPUS_PREDICATE_H_

#include <string>

#include <boost/optional.hpp>

#include "corpus/argument.h"
#include "corpus/word.h"

namespace oxsrl {

// A word whose semantic roles are annotated. Arguments are kept in the order
// they were discovered, which is not necessarily span order.
class Predicate : public Word {
 public:
  Predicate();

  Predicate(const Word& word, const boost::optional<std::string>& sense);

  Predicate(const Predicate& other);

  Predicate& operator=(const Predicate& other);

  static Predicate fromWord(const Word& word,
                            const boost::optional<std::string>& sense,
                            const Arguments& arguments = Arguments());

  const boost::optional<std::string>& sense() const { return sense_; }

  void set_sense(const std::string& sense) { sense_ = sense; }

  const Arguments& arguments() const { return arguments_; }

  Real score() const { return score_; }

  void set_score(Real score) { score_ = score; }

  Predicate& addArgument(const Argument& argument);

  // Points every argument's word view into the slots starting at base.
  void rebindWords(const Slot* base);

  bool operator==(const Predicate& other) const {
    return Word::operator==(other) && sense_ == other.sense_
        && arguments_ == other.arguments_;
  }

 private:
  void rebindPredicate();

  boost::optional<std::string> sense_;
  Arguments arguments_;
  Real score_;
};

}  // namespace oxsrl

#endif
