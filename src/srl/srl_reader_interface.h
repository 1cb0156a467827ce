#ifndef _SRL_READER_I_H_
#define _SRL_READER_I_H_

#include <string>
#include <vector>

#include "corpus/srl_sentence.h"
#include "srl/diagnostics.h"
#include "srl/sentence_block.h"

namespace oxsrl {

typedef std::vector<SrlSentence> SrlSentences;

class SrlReaderInterface {
 public:
  // Reads a corpus file, or every matching file below a directory.
  virtual SrlSentences read(const std::string& path) = 0;

  virtual SrlSentences readFile(const std::string& filename) = 0;

  // Builds one sentence from the lines of one block. Arguments left out of
  // the sentence are appended to diagnostics unless it is null.
  virtual SrlSentence parseSentence(const SentenceBlock& block,
                                    Diagnostics* diagnostics) const = 0;

  virtual const Diagnostics& diagnostics() const = 0;

  virtual ~SrlReaderInterface() {}
};

}  // namespace oxsrl

#endif
