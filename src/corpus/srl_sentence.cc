#include "corpus/srl_sentence.h"

#include <algorithm>

#include "corpus/errors.h"

namespace oxsrl {

ArgumentFormat argumentFormatFromString(const std::string& format) {
  if (format == "span") {
    return ArgumentFormat::span;
  } else if (format == "bio") {
    return ArgumentFormat::bio;
  }
  throw InvalidRequestError("Unknown format: " + format
                            + ". Available formats are: `span`, `bio`");
}

SrlSentence::SrlSentence() : Sentence() {}

SrlSentence::SrlSentence(const boost::optional<std::string>& id)
    : Sentence(id) {}

SrlSentence::SrlSentence(const std::vector<Word>& words,
                         const boost::optional<std::string>& id)
    : Sentence(words, id) {}

Predicate& SrlSentence::addPredicate(const Predicate& predicate,
                                     boost::optional<WordIndex> index) {
  if (!index) {
    index = predicate.index;
  }
  if (!index) {
    throw InvalidRequestError("Cannot infer index of predicate " + predicate.text);
  }
  if (*index < 0 || *index >= static_cast<WordIndex>(size())) {
    throw OutOfRangeError("Index out of range: provided index is "
                          + std::to_string(*index) + ", sentence length is "
                          + std::to_string(size()));
  }

  Predicate placed(predicate);
  placed.index = *index;
  set(*index, Slot(placed));
  return boost::get<Predicate>(slots_[*index]);
}

const Predicate& SrlSentence::getPredicate(WordIndex index) const {
  const Predicate* predicate = boost::get<Predicate>(&at(index));
  if (predicate == nullptr) {
    throw TypeMismatchError("Index " + std::to_string(index) + " is not a predicate");
  }
  return *predicate;
}

Predicate& SrlSentence::getPredicate(WordIndex index) {
  Predicate* predicate = boost::get<Predicate>(&mutable_at(index));
  if (predicate == nullptr) {
    throw TypeMismatchError("Index " + std::to_string(index) + " is not a predicate");
  }
  return *predicate;
}

std::vector<const Predicate*> SrlSentence::predicates() const {
  std::vector<const Predicate*> result;
  for (const auto& slot : slots_) {
    if (const Predicate* predicate = boost::get<Predicate>(&slot)) {
      result.push_back(predicate);
    }
  }
  return result;
}

std::vector<Predicate*> SrlSentence::predicates() {
  std::vector<Predicate*> result;
  for (auto& slot : slots_) {
    if (Predicate* predicate = boost::get<Predicate>(&slot)) {
      result.push_back(predicate);
    }
  }
  return result;
}

size_t SrlSentence::num_predicates() const {
  size_t count = 0;
  for (const auto& slot : slots_) {
    if (is_predicate(slot)) ++count;
  }
  return count;
}

Predicate& SrlSentence::predicateAt(size_t k) {
  std::vector<Predicate*> all = predicates();
  if (k >= all.size()) {
    throw OutOfRangeError("Predicate " + std::to_string(k)
                          + " requested, sentence has "
                          + std::to_string(all.size()) + " predicates");
  }
  return *all[k];
}

const Argument& SrlSentence::makeArgument(WordIndex predicate_index,
                                          const Label& role, WordIndex start,
                                          WordIndex end) {
  Predicate& predicate = getPredicate(predicate_index);
  predicate.addArgument(Argument(role, &predicate, slice(start, end), start, end));
  return predicate.arguments().back();
}

const Arguments& SrlSentence::getPredicateArguments(WordIndex index) const {
  return getPredicate(index).arguments();
}

const Arguments& SrlSentence::getPredicateArguments(
    const Predicate& predicate) const {
  return getPredicateArguments(predicateIndex(predicate));
}

Tags SrlSentence::getPredicateArgumentsBio(WordIndex index) const {
  Tags bio_tags(size(), "O");
  for (const auto& argument : getPredicate(index).arguments()) {
    Tags argument_tags = argument.bio_tag();
    std::copy(argument_tags.begin(), argument_tags.end(),
              bio_tags.begin() + argument.start_index());
  }
  return bio_tags;
}

Tags SrlSentence::getPredicateArgumentsBio(const Predicate& predicate) const {
  return getPredicateArgumentsBio(predicateIndex(predicate));
}

PredicateArguments SrlSentence::getPredicateArguments(
    WordIndex index, ArgumentFormat format) const {
  switch (format) {
    case ArgumentFormat::span:
      return getPredicateArguments(index);
    case ArgumentFormat::bio:
      return getPredicateArgumentsBio(index);
  }
  throw InvalidRequestError("Unknown argument format");
}

PredicateArguments SrlSentence::getPredicateArguments(
    WordIndex index, const std::string& format) const {
  return getPredicateArguments(index, argumentFormatFromString(format));
}

PredicateArguments SrlSentence::getPredicateArguments(
    const Predicate& predicate, const std::string& format) const {
  return getPredicateArguments(predicateIndex(predicate), format);
}

size_t SrlSentence::num_arguments() const {
  size_t count = 0;
  for (const auto* predicate : predicates()) {
    count += predicate->arguments().size();
  }
  return count;
}

WordIndex SrlSentence::predicateIndex(const Predicate& predicate) const {
  if (!predicate.index) {
    throw InvalidRequestError("Predicate " + predicate.text + " has no index");
  }
  return *predicate.index;
}

}  // namespace oxsrl
