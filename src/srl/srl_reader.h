#ifndef _SRL_READER_H_
#define _SRL_READER_H_

#include <iostream>
#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "corpus/errors.h"
#include "corpus/utils.h"
#include "srl/diagnostics.h"
#include "srl/reader_config.h"
#include "srl/sentence_block.h"
#include "srl/srl_reader_interface.h"
#include "srl/token_normalizer.h"

namespace oxsrl {

// Shared file handling of the dialect readers: file listing, grouping lines
// into sentence blocks and collecting diagnostics. Dialects implement
// parseSentence.
class SrlReader : public SrlReaderInterface {
 public:
  explicit SrlReader(const boost::shared_ptr<ReaderConfig>& config);

  // Files of a directory are parsed in path order, in parallel when the
  // config asks for more than one thread. Sentences come back in file order,
  // then block order.
  SrlSentences read(const std::string& path) override;

  SrlSentences readFile(const std::string& filename) override;

  SrlSentences readStream(std::istream& in, const std::string& name);

  // Regular files below path ending in the configured suffix, sorted.
  // Throws CorpusFormatError when path cannot be walked.
  std::vector<std::string> listFiles(const std::string& path) const;

  const Diagnostics& diagnostics() const override { return diagnostics_; }

  void clearDiagnostics() { diagnostics_.clear(); }

  const boost::shared_ptr<ReaderConfig>& config() const { return config_; }

 protected:
  SrlSentences parseStream(std::istream& in, const std::string& filename,
                           Diagnostics* diagnostics) const;

  SrlSentences parseFile(const std::string& filename,
                         Diagnostics* diagnostics) const;

  // Splits every line of the block and checks that all lines have the same
  // number of columns, at least min_columns.
  std::vector<Columns> splitBlock(const SentenceBlock& block,
                                  size_t min_columns, bool tabs_only) const;

  // Parses a token id. Throws CorpusFormatError on anything but an integer.
  WordIndex parseIndex(const SentenceBlock& block, size_t line,
                       const std::string& value) const;

  // Checks that the normalized index of the token on line equals its slot.
  void checkPosition(const SentenceBlock& block, size_t line,
                     WordIndex index) const;

  void checkRoleColumns(const SentenceBlock& block, size_t role_columns,
                        size_t predicates) const;

  CorpusFormatError formatError(const SentenceBlock& block, size_t line,
                                const std::string& message) const;

  void addDiagnostics(const Diagnostics& dropped);

  boost::shared_ptr<ReaderConfig> config_;
  TokenNormalizer normalizer_;

 private:
  Diagnostics diagnostics_;
};

}  // namespace oxsrl

#endif
