#ifndef _CORPUS_WORD_H_
#define _CORPUS_WORD_H_

#include <iostream>
#include <string>

#include <boost/optional.hpp>

#include "corpus/utils.h"

namespace oxsrl {

// A token with its linguistic attributes.
struct Word {
  Word();

  Word(const std::string& text, boost::optional<WordIndex> index);

  std::string                 text;
  boost::optional<WordIndex>  index;
  boost::optional<int>        start_char;
  boost::optional<int>        end_char;
  boost::optional<std::string> lemma;
  boost::optional<std::string> pos;
  boost::optional<std::string> dep;
  boost::optional<WordIndex>  head;

  bool operator==(const Word& other) const;
};

std::ostream& operator<<(std::ostream& out, const Word& word);

}  // namespace oxsrl

#endif
