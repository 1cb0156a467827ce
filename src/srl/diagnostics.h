#ifndef _SRL_DIAGNOSTICS_H_
#define _SRL_DIAGNOSTICS_H_

#include <iostream>
#include <string>
#include <vector>

#include "corpus/utils.h"

namespace oxsrl {

// An argument that could not be resolved against its sentence and was left
// out of it.
struct DroppedArgument {
  DroppedArgument()
      : filename(), line_number(0), sentence_id(), predicate_column(0),
        role(), start(0), end(0), reason() {}

  std::string filename;
  int         line_number;
  std::string sentence_id;
  size_t      predicate_column;
  Label       role;
  WordIndex   start;
  WordIndex   end;
  std::string reason;
};

typedef std::vector<DroppedArgument> Diagnostics;

inline std::ostream& operator<<(std::ostream& out, const DroppedArgument& dropped) {
  return out << dropped.filename << ":" << dropped.line_number
             << ": dropped argument (" << dropped.role << ", " << dropped.start
             << ", " << dropped.end << ") of predicate column "
             << dropped.predicate_column << " in sentence " << dropped.sentence_id
             << ": " << dropped.reason;
}

}  // namespace oxsrl

#endif
