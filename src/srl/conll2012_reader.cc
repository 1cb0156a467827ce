#include "srl/conll2012_reader.h"

#include <boost/algorithm/string.hpp>

#include "srl/bio.h"

namespace oxsrl {

const size_t Conll2012Reader::kMinColumns;
const size_t Conll2012Reader::kFirstRoleColumn;

Conll2012Reader::Conll2012Reader(const boost::shared_ptr<ReaderConfig>& config)
    : SrlReader(config) {}

Label Conll2012Reader::bracketToBio(const std::string& annotation,
                                    boost::optional<Label>* open_label) {
  Label bio_label;
  if (annotation.find('(') != std::string::npos) {
    // entering a span
    Label label = boost::algorithm::trim_copy_if(
        annotation, boost::algorithm::is_any_of("()*"));
    bio_label = "B-" + label;
    *open_label = label;
  } else if (*open_label) {
    bio_label = "I-" + **open_label;
  } else {
    bio_label = "O";
  }

  if (annotation.find(')') != std::string::npos) {
    *open_label = boost::none;
  }
  return bio_label;
}

SrlSentence Conll2012Reader::parseSentence(const SentenceBlock& block,
                                           Diagnostics* /*diagnostics*/) const {
  // 0 document, 1 part, 2 word number, 3 form, 4 pos, 5 parse bit,
  // 6 frame id or lemma, 7 sense, 8 word sense, 9 speaker, 10 entities,
  // 11 .. n-2 one role column per predicate, n-1 coreference
  std::vector<Columns> lines = splitBlock(block, kMinColumns, false);
  size_t role_columns = lines.front().size() - kFirstRoleColumn - 1;

  size_t num_predicates = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    checkPosition(block, i, parseIndex(block, i, lines[i][2]));
    if (lines[i][7] != "-") ++num_predicates;
  }
  checkRoleColumns(block, role_columns, num_predicates);

  SrlSentence sentence(lines.front()[1]);
  Indices predicate_indices;
  std::vector<Tags> span_labels(role_columns);
  std::vector<boost::optional<Label>> open_labels(role_columns);

  for (size_t i = 0; i < lines.size(); ++i) {
    const Columns& columns = lines[i];
    Word word(normalizer_.normalize(columns[3]), static_cast<WordIndex>(i));
    word.pos = columns[4];
    if (columns[6] != "-") word.lemma = columns[6];

    if (columns[7] != "-") {
      // PropBank senses are frame id and sense label joined by a dot
      std::string sense = is_digits(columns[6])
          ? columns[6] + "." + columns[7] : columns[7];
      sentence.push_back(Predicate::fromWord(word, sense));
      predicate_indices.push_back(i);
    } else {
      sentence.push_back(word);
    }

    for (size_t k = 0; k < role_columns; ++k) {
      span_labels[k].push_back(
          bracketToBio(columns[kFirstRoleColumn + k], &open_labels[k]));
    }
  }

  for (size_t k = 0; k < role_columns; ++k) {
    for (const auto& span : bioToSpans(span_labels[k])) {
      if (span.label == "V") continue;
      sentence.makeArgument(predicate_indices[k], span.label, span.start, span.end);
    }
  }

  return sentence;
}

}  // namespace oxsrl
