#ifndef _SRL_TOKEN_NORMALIZER_H_
#define _SRL_TOKEN_NORMALIZER_H_

#include <map>
#include <string>

namespace oxsrl {

// Decodes the treebank escape codes for brackets, braces and quotes.
class TokenNormalizer {
 public:
  TokenNormalizer();

  std::string normalize(const std::string& form) const;

  // United corpus forms: a missing or single blank form is a lost double
  // quote in that corpus.
  std::string normalizeUnited(const std::string& form) const;

 private:
  std::map<std::string, std::string> escapes_;
};

}  // namespace oxsrl

#endif
