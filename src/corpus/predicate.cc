#include "corpus/predicate.h"

namespace oxsrl {

Predicate::Predicate() : Word(), sense_(), arguments_(), score_(0) {}

Predicate::Predicate(const Word& word, const boost::optional<std::string>& sense)
    : Word(word), sense_(sense), arguments_(), score_(0) {}

Predicate::Predicate(const Predicate& other)
    : Word(other),
      sense_(other.sense_),
      arguments_(other.arguments_),
      score_(other.score_) {
  rebindPredicate();
}

Predicate& Predicate::operator=(const Predicate& other) {
  Word::operator=(other);
  sense_ = other.sense_;
  arguments_ = other.arguments_;
  score_ = other.score_;
  rebindPredicate();
  return *this;
}

Predicate Predicate::fromWord(const Word& word,
                              const boost::optional<std::string>& sense,
                              const Arguments& arguments) {
  Predicate predicate(word, sense);
  for (const auto& argument : arguments) {
    predicate.addArgument(argument);
  }
  return predicate;
}

Predicate& Predicate::addArgument(const Argument& argument) {
  arguments_.push_back(argument);
  arguments_.back().predicate_ = this;
  return *this;
}

void Predicate::rebindWords(const Slot* base) {
  for (auto& argument : arguments_) {
    argument.words_begin_ = base + argument.start_index_;
    argument.words_end_ = base + argument.end_index_;
  }
}

void Predicate::rebindPredicate() {
  for (auto& argument : arguments_) {
    argument.predicate_ = this;
  }
}

}  // namespace oxsrl
