#include "corpus/word.h"

namespace oxsrl {

Word::Word() : text(), index() {}

Word::Word(const std::string& text, boost::optional<WordIndex> index)
    : text(text), index(index) {}

bool Word::operator==(const Word& other) const {
  return text == other.text
      && index == other.index
      && start_char == other.start_char
      && end_char == other.end_char
      && lemma == other.lemma
      && pos == other.pos
      && dep == other.dep
      && head == other.head;
}

std::ostream& operator<<(std::ostream& out, const Word& word) {
  return out << word.text;
}

}  // namespace oxsrl
