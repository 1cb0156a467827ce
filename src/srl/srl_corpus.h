#ifndef _SRL_CORPUS_H_
#define _SRL_CORPUS_H_

#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>

#include "corpus/corpus_interface.h"
#include "corpus/dict.h"
#include "corpus/srl_sentence.h"
#include "srl/diagnostics.h"
#include "srl/reader_config.h"

namespace oxsrl {

// The sentences of an SRL corpus with the role and sense inventory seen in
// them.
class SrlCorpus : public CorpusInterface {
 public:
  SrlCorpus(const boost::shared_ptr<ReaderConfig>& config);

  SrlCorpus(const boost::shared_ptr<ReaderConfig>& config,
            const boost::shared_ptr<Dict>& dict);

  // Reads a corpus file or directory in the configured format.
  void readFile(const std::string& filename) override;

  void add_sentence(const SrlSentence& sent);

  const SrlSentence& sentence_at(unsigned i) const {
    return sentences_.at(i);
  }

  const std::vector<SrlSentence>& sentences() const {
    return sentences_;
  }

  const boost::shared_ptr<Dict>& dict() const {
    return dict_;
  }

  const Diagnostics& diagnostics() const {
    return diagnostics_;
  }

  size_t size() const override;

  size_t numTokens() const override;

  size_t numPredicates() const;

  size_t numArguments() const;

  // Argument counts indexed by role id in dict().
  std::vector<int> roleCounts() const override;

  // Predicate counts indexed by sense id in dict().
  std::vector<int> senseCounts() const;

 private:
  void addLabels(const SrlSentence& sent);

  std::vector<SrlSentence> sentences_;
  boost::shared_ptr<ReaderConfig> config_;
  boost::shared_ptr<Dict> dict_;
  Diagnostics diagnostics_;
};

}  // namespace oxsrl

#endif
