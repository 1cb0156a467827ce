#ifndef _CORPUS_ARGUMENT_H_
#define _CORPUS_ARGUMENT_H_

#include <iostream>
#include <string>
#include <utility>

#include "corpus/slot.h"
#include "corpus/utils.h"

namespace oxsrl {

class Predicate;

// A span of words filling a semantic role of one predicate. The span is half
// open: it covers the slots [start_index, end_index).
class Argument {
 public:
  Argument(const Label& role, const Predicate* predicate, SlotRange words,
           WordIndex start_index, WordIndex end_index);

  const Label& role() const { return role_; }

  // The owning predicate. Not owned; valid while the sentence lives.
  const Predicate* predicate() const { return predicate_; }

  SlotRange words() const;

  WordIndex start_index() const { return start_index_; }

  WordIndex end_index() const { return end_index_; }

  std::pair<WordIndex, WordIndex> span() const {
    return std::make_pair(start_index_, end_index_);
  }

  size_t size() const { return end_index_ - start_index_; }

  // B-role followed by I-role for every remaining word of the span.
  Tags bio_tag() const;

  bool operator==(const Argument& other) const {
    return role_ == other.role_
        && start_index_ == other.start_index_
        && end_index_ == other.end_index_;
  }

  bool operator!=(const Argument& other) const { return !(*this == other); }

 private:
  friend class Predicate;

  Label role_;
  const Predicate* predicate_;
  const Slot* words_begin_;
  const Slot* words_end_;
  WordIndex start_index_;
  WordIndex end_index_;
};

typedef std::vector<Argument> Arguments;

std::ostream& operator<<(std::ostream& out, const Argument& argument);

}  // namespace oxsrl

#endif
