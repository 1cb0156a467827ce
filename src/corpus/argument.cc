#include "corpus/argument.h"
#include "corpus/errors.h"
#include "corpus/predicate.h"

namespace oxsrl {

Argument::Argument(const Label& role, const Predicate* predicate,
                   SlotRange words, WordIndex start_index,
                   WordIndex end_index)
    : role_(role),
      predicate_(predicate),
      words_begin_(words.begin()),
      words_end_(words.end()),
      start_index_(start_index),
      end_index_(end_index) {
  if (start_index < 0 || start_index >= end_index) {
    throw OutOfRangeError("Invalid argument span (" + std::to_string(start_index)
                          + ", " + std::to_string(end_index) + ") for role "
                          + role);
  }
  if (words.size() != end_index - start_index) {
    throw InvalidRequestError("Argument " + role + " spans "
                              + std::to_string(end_index - start_index)
                              + " words but was given "
                              + std::to_string(words.size()));
  }
}

SlotRange Argument::words() const {
  return SlotRange(words_begin_, words_end_);
}

Tags Argument::bio_tag() const {
  Tags tags(1, "B-" + role_);
  tags.insert(tags.end(), end_index_ - start_index_ - 1, "I-" + role_);
  return tags;
}

std::ostream& operator<<(std::ostream& out, const Argument& argument) {
  return out << "(" << argument.role() << ", " << argument.start_index() << ", "
             << argument.end_index() << ")";
}

}  // namespace oxsrl
