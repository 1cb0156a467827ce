#ifndef _SRL_BIO_H_
#define _SRL_BIO_H_

#include <iostream>
#include <string>
#include <vector>

#include "corpus/utils.h"

namespace oxsrl {

// A labelled half-open range [start, end) of token positions.
struct Span {
  Span() : label(), start(0), end(0) {}

  Span(const Label& label, WordIndex start, WordIndex end)
      : label(label), start(start), end(end) {}

  Label     label;
  WordIndex start;
  WordIndex end;

  bool operator==(const Span& other) const {
    return label == other.label && start == other.start && end == other.end;
  }

  bool operator!=(const Span& other) const { return !(*this == other); }
};

typedef std::vector<Span> Spans;

std::ostream& operator<<(std::ostream& out, const Span& span);

// True for tags that mark "no label": O, _ and a bare B-/I- prefix.
bool isOutsideTag(const Label& tag);

// The label of a tag without its B-/I- prefix. Tags without a prefix are
// their own label.
Label labelOf(const Label& tag);

// Converts a BIO tag sequence to spans in left-to-right order. Never throws:
// missing B- tags and runs of I- tags without an opener are resolved by label
// continuity.
Spans bioToSpans(const Tags& tags);

// Inverse of bioToSpans. Throws OutOfRangeError for a span outside
// [0, length) and InvalidRequestError for overlapping spans.
Tags spansToBio(const Spans& spans, size_t length);

}  // namespace oxsrl

#endif
