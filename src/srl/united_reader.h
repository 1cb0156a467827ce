#ifndef _SRL_UNITED_READER_H_
#define _SRL_UNITED_READER_H_

#include <map>
#include <string>

#include <boost/optional.hpp>

#include "srl/bio.h"
#include "srl/srl_reader.h"

namespace oxsrl {

// Reads the CoNLL-U derived United SRL format: tab separated
// "id form lemma frame roles..." lines, with document_id and sentence_id
// metadata comments. Each role column is either BIO span encoded or holds
// dependency style single token roles.
class UnitedSrlReader : public SrlReader {
 public:
  explicit UnitedSrlReader(const boost::shared_ptr<ReaderConfig>& config);

  SrlSentence parseSentence(const SentenceBlock& block,
                            Diagnostics* diagnostics) const override;

  // "# key = value" comments of a block.
  static std::map<std::string, std::string> parseMetadata(
      const std::vector<std::string>& comments);

  // The argument spans of one role column, predicate self markers excluded.
  static Spans columnSpans(const Tags& roles);

  static const size_t kMinColumns = 4;
  static const size_t kFirstRoleColumn = 4;

 private:
  boost::optional<std::string> sentenceId(const SentenceBlock& block) const;
};

}  // namespace oxsrl

#endif
