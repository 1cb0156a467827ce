#ifndef _SRL_CONLL2012_READER_H_
#define _SRL_CONLL2012_READER_H_

#include <string>

#include <boost/optional.hpp>

#include "srl/srl_reader.h"

namespace oxsrl {

// Reads OntoNotes CoNLL-2012 files. Role columns use bracket markup:
// "(ARG0*" opens a span, "*" continues it or marks no annotation, "*)"
// closes it.
class Conll2012Reader : public SrlReader {
 public:
  explicit Conll2012Reader(const boost::shared_ptr<ReaderConfig>& config);

  SrlSentence parseSentence(const SentenceBlock& block,
                            Diagnostics* diagnostics) const override;

  // Converts one role column annotation to a BIO tag. open_label carries the
  // label of the span still open from the previous token of this column.
  static Label bracketToBio(const std::string& annotation,
                            boost::optional<Label>* open_label);

  static const size_t kMinColumns = 12;
  static const size_t kFirstRoleColumn = 11;
};

}  // namespace oxsrl

#endif
