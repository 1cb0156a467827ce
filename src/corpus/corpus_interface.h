#ifndef _CORPUS_CORPUS_I_H_
#define _CORPUS_CORPUS_I_H_

#include <string>
#include <vector>

namespace oxsrl {

class CorpusInterface {
  public:
  virtual void readFile(const std::string& filename) = 0;

  virtual size_t size() const = 0;

  virtual size_t numTokens() const = 0;

  virtual std::vector<int> roleCounts() const = 0;

  virtual ~CorpusInterface() {}
};

}

#endif
