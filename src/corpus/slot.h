#ifndef _CORPUS_SLOT_H_
#define _CORPUS_SLOT_H_

#include <vector>

#include <boost/range/iterator_range.hpp>
#include <boost/variant.hpp>

#include "corpus/word.h"

namespace oxsrl {

class Predicate;

// A sentence position holds either a plain word or a promoted predicate.
typedef boost::variant<Word, Predicate> Slot;
typedef std::vector<Slot> Slots;

// Non-owning view over consecutive slots of a sentence.
typedef boost::iterator_range<const Slot*> SlotRange;

// The word fields of a slot, whichever alternative it holds.
const Word& word_of(const Slot& slot);

Word& word_of(Slot& slot);

bool is_predicate(const Slot& slot);

}  // namespace oxsrl

#endif
