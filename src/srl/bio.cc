#include "srl/bio.h"

#include <sstream>

#include <boost/algorithm/string/predicate.hpp>

#include "corpus/errors.h"

namespace oxsrl {

namespace {

bool beginsSpan(const Label& tag) {
  return boost::algorithm::starts_with(tag, "B-");
}

}  // namespace

std::ostream& operator<<(std::ostream& out, const Span& span) {
  return out << "(" << span.label << ", " << span.start << ", " << span.end << ")";
}

bool isOutsideTag(const Label& tag) {
  return tag.empty() || tag == "O" || tag == "_" || tag == "B-" || tag == "I-";
}

Label labelOf(const Label& tag) {
  if (boost::algorithm::starts_with(tag, "B-")
      || boost::algorithm::starts_with(tag, "I-")) {
    return tag.substr(2);
  }
  return tag;
}

Spans bioToSpans(const Tags& tags) {
  Spans spans;
  bool open = false;
  for (size_t i = 0; i < tags.size(); ++i) {
    const Label& tag = tags[i];
    if (isOutsideTag(tag)) {
      open = false;
      continue;
    }

    Label label = labelOf(tag);
    if (beginsSpan(tag) || !open || label != spans.back().label) {
      spans.push_back(Span(label, i, -1));
      open = true;
    }

    bool last = (i + 1 == tags.size());
    if (last || isOutsideTag(tags[i + 1]) || beginsSpan(tags[i + 1])
        || labelOf(tags[i + 1]) != label) {
      spans.back().end = i + 1;
      open = false;
    }
  }

  return spans;
}

Tags spansToBio(const Spans& spans, size_t length) {
  Tags tags(length, "O");
  std::vector<bool> covered(length, false);
  for (const auto& span : spans) {
    if (span.start < 0 || span.start >= span.end
        || span.end > static_cast<WordIndex>(length)) {
      std::ostringstream message;
      message << "Span " << span << " is outside a sequence of length " << length;
      throw OutOfRangeError(message.str());
    }
    for (WordIndex i = span.start; i < span.end; ++i) {
      if (covered[i]) {
        std::ostringstream message;
        message << "Span " << span << " overlaps another span at position " << i;
        throw InvalidRequestError(message.str());
      }
      covered[i] = true;
      tags[i] = (i == span.start ? "B-" : "I-") + span.label;
    }
  }

  return tags;
}

}  // namespace oxsrl
