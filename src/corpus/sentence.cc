#include "corpus/sentence.h"
#include "corpus/errors.h"

namespace oxsrl {

namespace {

struct SlotWordVisitor : public boost::static_visitor<const Word&> {
  const Word& operator()(const Word& word) const { return word; }
};

struct MutableSlotWordVisitor : public boost::static_visitor<Word&> {
  Word& operator()(Word& word) const { return word; }
};

}  // namespace

const Word& word_of(const Slot& slot) {
  return boost::apply_visitor(SlotWordVisitor(), slot);
}

Word& word_of(Slot& slot) {
  MutableSlotWordVisitor visitor;
  return boost::apply_visitor(visitor, slot);
}

bool is_predicate(const Slot& slot) {
  return boost::get<Predicate>(&slot) != nullptr;
}

Sentence::Sentence() : slots_(), id_() {}

Sentence::Sentence(const boost::optional<std::string>& id)
    : slots_(), id_(id) {}

Sentence::Sentence(const std::vector<Word>& words,
                   const boost::optional<std::string>& id)
    : slots_(words.begin(), words.end()), id_(id) {}

Sentence::Sentence(const Sentence& other)
    : slots_(other.slots_), id_(other.id_) {
  rebindArguments();
}

Sentence::Sentence(Sentence&& other)
    : slots_(std::move(other.slots_)), id_(std::move(other.id_)) {
  rebindArguments();
}

Sentence& Sentence::operator=(const Sentence& other) {
  slots_ = other.slots_;
  id_ = other.id_;
  rebindArguments();
  return *this;
}

Sentence& Sentence::operator=(Sentence&& other) {
  slots_ = std::move(other.slots_);
  id_ = std::move(other.id_);
  rebindArguments();
  return *this;
}

void Sentence::set(WordIndex i, const Slot& slot) {
  checkIndex(i);
  checkSpans(slot, size());
  mutable_at(i) = slot;
  if (Predicate* predicate = boost::get<Predicate>(&slots_[i])) {
    predicate->rebindWords(slots_.data());
  }
}

const Slot& Sentence::at(WordIndex i) const {
  checkIndex(i);
  return slots_[i];
}

Slot& Sentence::mutable_at(WordIndex i) {
  checkIndex(i);
  return slots_[i];
}

SlotRange Sentence::slice(WordIndex start, WordIndex end) const {
  if (start < 0 || start >= end || end > static_cast<WordIndex>(size())) {
    throw OutOfRangeError("Invalid span (" + std::to_string(start) + ", "
                          + std::to_string(end) + "), sentence length is "
                          + std::to_string(size()));
  }
  return SlotRange(slots_.data() + start, slots_.data() + end);
}

void Sentence::checkIndex(WordIndex i) const {
  if (i < 0 || i >= static_cast<WordIndex>(size())) {
    throw OutOfRangeError("Index out of range: provided index is "
                          + std::to_string(i) + ", sentence length is "
                          + std::to_string(size()));
  }
}

void Sentence::checkSpans(const Slot& slot, size_t length) const {
  const Predicate* predicate = boost::get<Predicate>(&slot);
  if (predicate == nullptr) return;
  for (const auto& argument : predicate->arguments()) {
    if (argument.end_index() > static_cast<WordIndex>(length)) {
      throw OutOfRangeError("Argument " + argument.role() + " of predicate "
                            + predicate->text + " ends at "
                            + std::to_string(argument.end_index())
                            + ", sentence length is " + std::to_string(length));
    }
  }
}

void Sentence::push_slot(const Slot& slot) {
  checkSpans(slot, size() + 1);
  const Slot* old_data = slots_.data();
  slots_.push_back(slot);
  if (slots_.data() != old_data) {
    rebindArguments();
  } else if (Predicate* predicate = boost::get<Predicate>(&slots_.back())) {
    predicate->rebindWords(slots_.data());
  }
}

void Sentence::rebindArguments() {
  for (auto& slot : slots_) {
    if (Predicate* predicate = boost::get<Predicate>(&slot)) {
      predicate->rebindWords(slots_.data());
    }
  }
}

}  // namespace oxsrl
