#ifndef _CORPUS_SENT_H_
#define _CORPUS_SENT_H_

#include <iostream>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "corpus/predicate.h"
#include "corpus/slot.h"
#include "corpus/word.h"

namespace oxsrl {

// An ordered, indexable sequence of slots. Slot identity is positional:
// replacing the content of a slot never moves it, so argument spans that
// reference a position stay valid.
class Sentence {
 public:
  typedef Slots::const_iterator const_iterator;

  Sentence();

  explicit Sentence(const boost::optional<std::string>& id);

  Sentence(const std::vector<Word>& words,
           const boost::optional<std::string>& id = boost::none);

  Sentence(const Sentence& other);

  Sentence(Sentence&& other);

  Sentence& operator=(const Sentence& other);

  Sentence& operator=(Sentence&& other);

  virtual ~Sentence() {}

  void push_back(const Word& word) { push_slot(Slot(word)); }

  void push_back(const Predicate& predicate) { push_slot(Slot(predicate)); }

  // Replaces the content of slot i. Throws OutOfRangeError for a bad index
  // or a predicate whose arguments do not fit the sentence.
  void set(WordIndex i, const Slot& slot);

  const Slot& at(WordIndex i) const;

  const Slot& operator[](WordIndex i) const { return at(i); }

  const Word& word_at(WordIndex i) const { return word_of(at(i)); }

  bool is_predicate_at(WordIndex i) const { return is_predicate(at(i)); }

  // View over the slots [start, end). Throws OutOfRangeError unless
  // 0 <= start < end <= size().
  SlotRange slice(WordIndex start, WordIndex end) const;

  size_t size() const { return slots_.size(); }

  bool empty() const { return slots_.empty(); }

  const_iterator begin() const { return slots_.begin(); }

  const_iterator end() const { return slots_.end(); }

  const boost::optional<std::string>& id() const { return id_; }

  void set_id(const std::string& id) { id_ = id; }

  std::string sentence_string() const {
    std::string sent = "";
    for (const auto& slot : slots_) {
      sent += word_of(slot).text + " ";
    }
    return sent;
  }

  void print_sentence() const {
    std::cout << sentence_string() << std::endl;
  }

 protected:
  void checkIndex(WordIndex i) const;

  // Throws OutOfRangeError if slot holds a predicate with an argument ending
  // past length.
  void checkSpans(const Slot& slot, size_t length) const;

  Slot& mutable_at(WordIndex i);

  Slots slots_;

 private:
  void push_slot(const Slot& slot);

  void rebindArguments();

  boost::optional<std::string> id_;
};

}  // namespace oxsrl

#endif
