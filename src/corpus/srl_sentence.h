#ifndef _CORPUS_SRL_SENT_H_
#define _CORPUS_SRL_SENT_H_

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "corpus/argument.h"
#include "corpus/predicate.h"
#include "corpus/sentence.h"

namespace oxsrl {

enum class ArgumentFormat {span, bio};

// Parses "span" or "bio", throws InvalidRequestError otherwise.
ArgumentFormat argumentFormatFromString(const std::string& format);

// Result of getPredicateArguments: the argument list for the span format, a
// tag per word for the bio format.
typedef boost::variant<Arguments, Tags> PredicateArguments;

// A sentence annotated with predicates and their argument spans.
class SrlSentence : public Sentence {
 public:
  SrlSentence();

  explicit SrlSentence(const boost::optional<std::string>& id);

  SrlSentence(const std::vector<Word>& words,
              const boost::optional<std::string>& id = boost::none);

  // Puts predicate in slot index, or in the slot named by its own index when
  // index is not given.
  Predicate& addPredicate(const Predicate& predicate,
                          boost::optional<WordIndex> index = boost::none);

  // Throws OutOfRangeError or TypeMismatchError.
  const Predicate& getPredicate(WordIndex index) const;

  Predicate& getPredicate(WordIndex index);

  // Predicates in slot order, derived from the current slot contents.
  std::vector<const Predicate*> predicates() const;

  std::vector<Predicate*> predicates();

  size_t num_predicates() const;

  // The k-th predicate in slot order.
  Predicate& predicateAt(size_t k);

  // Builds an argument over [start, end) and appends it to the predicate in
  // slot predicate_index.
  const Argument& makeArgument(WordIndex predicate_index, const Label& role,
                               WordIndex start, WordIndex end);

  const Arguments& getPredicateArguments(WordIndex index) const;

  const Arguments& getPredicateArguments(const Predicate& predicate) const;

  Tags getPredicateArgumentsBio(WordIndex index) const;

  Tags getPredicateArgumentsBio(const Predicate& predicate) const;

  PredicateArguments getPredicateArguments(WordIndex index,
                                           ArgumentFormat format) const;

  PredicateArguments getPredicateArguments(WordIndex index,
                                           const std::string& format) const;

  PredicateArguments getPredicateArguments(const Predicate& predicate,
                                           const std::string& format) const;

  size_t num_arguments() const;

 private:
  WordIndex predicateIndex(const Predicate& predicate) const;
};

}  // namespace oxsrl

#endif
