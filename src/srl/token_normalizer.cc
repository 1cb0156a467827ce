#include "srl/token_normalizer.h"

namespace oxsrl {

TokenNormalizer::TokenNormalizer()
    : escapes_({{"-LRB-", "("}, {"-RRB-", ")"},
                {"-LSB-", "["}, {"-RSB-", "]"},
                {"-LCB-", "{"}, {"-RCB-", "}"},
                {"``", "\""}, {"''", "\""}}) {}

std::string TokenNormalizer::normalize(const std::string& form) const {
  auto i = escapes_.find(form);
  if (i == escapes_.end()) {
    return form;
  }
  return i->second;
}

std::string TokenNormalizer::normalizeUnited(const std::string& form) const {
  if (form.empty() || form == " ") {
    return "\"";
  }
  return normalize(form);
}

}  // namespace oxsrl
