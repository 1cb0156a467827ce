#ifndef _SRL_CONLL2009_READER_H_
#define _SRL_CONLL2009_READER_H_

#include "srl/srl_reader.h"

namespace oxsrl {

// Reads CoNLL-2009 files. Arguments are single tokens: every non-placeholder
// entry of a role column is an argument of that column's predicate.
class Conll2009Reader : public SrlReader {
 public:
  explicit Conll2009Reader(const boost::shared_ptr<ReaderConfig>& config);

  SrlSentence parseSentence(const SentenceBlock& block,
                            Diagnostics* diagnostics) const override;

  static const size_t kMinColumns = 14;
  static const size_t kFirstRoleColumn = 14;
};

}  // namespace oxsrl

#endif
