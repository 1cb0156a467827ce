#include "srl/conll2009_reader.h"

#include <boost/optional.hpp>

namespace oxsrl {

const size_t Conll2009Reader::kMinColumns;
const size_t Conll2009Reader::kFirstRoleColumn;

Conll2009Reader::Conll2009Reader(const boost::shared_ptr<ReaderConfig>& config)
    : SrlReader(config) {}

SrlSentence Conll2009Reader::parseSentence(const SentenceBlock& block,
                                           Diagnostics* /*diagnostics*/) const {
  // 0 id, 1 form, 2 lemma, 3 plemma, 4 pos, 5 ppos, 6 feat, 7 pfeat,
  // 8 head, 9 phead, 10 deprel, 11 pdeprel, 12 fillpred, 13 pred,
  // 14.. one role column per predicate
  std::vector<Columns> lines = splitBlock(block, kMinColumns, false);
  size_t role_columns = lines.front().size() - kFirstRoleColumn;

  std::vector<boost::optional<WordIndex>> heads;
  size_t num_predicates = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    checkPosition(block, i, parseIndex(block, i, lines[i][0]) - 1);
    const std::string& head = lines[i][8];
    if (head == "_") {
      heads.push_back(boost::none);
    } else {
      WordIndex head_index = parseIndex(block, i, head);
      if (head_index < 0 || head_index > static_cast<WordIndex>(lines.size())) {
        throw formatError(block, i, "Head " + head + " is outside the sentence");
      }
      // head 0 is the root
      heads.push_back(head_index == 0 ? kRootHead : head_index - 1);
    }
    if (lines[i][12] == "Y") ++num_predicates;
  }
  checkRoleColumns(block, role_columns, num_predicates);

  // conll 2009 doesn't have a sentence id
  SrlSentence sentence;
  Indices predicate_indices;
  for (size_t i = 0; i < lines.size(); ++i) {
    const Columns& columns = lines[i];
    Word word(columns[1], static_cast<WordIndex>(i));
    word.lemma = columns[2];
    word.pos = columns[4];
    if (columns[10] != "_") word.dep = columns[10];
    word.head = heads[i];

    if (columns[12] == "Y") {
      sentence.push_back(Predicate::fromWord(word, columns[13]));
      predicate_indices.push_back(i);
    } else {
      sentence.push_back(word);
    }
  }

  for (size_t i = 0; i < lines.size(); ++i) {
    for (size_t k = 0; k < role_columns; ++k) {
      const std::string& role = lines[i][kFirstRoleColumn + k];
      if (role == "_") continue;
      sentence.makeArgument(predicate_indices[k], role, i, i + 1);
    }
  }

  return sentence;
}

}  // namespace oxsrl
