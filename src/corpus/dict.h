#ifndef _CORPUSDICT_H_
#define _CORPUSDICT_H_

#include <map>
#include <string>
#include <vector>

#include "corpus/utils.h"

namespace oxsrl {

typedef int LabelId;

// Maps role labels and predicate senses to dense ids. Id 0 is reserved for
// unknown labels, which is what frozen lookups of unseen labels return.
class Dict {
 public:
  Dict();

  LabelId convertRole(const Label& role, bool frozen);

  LabelId convertSense(const Label& sense, bool frozen);

  Label lookupRole(LabelId id) const;

  Label lookupSense(LabelId id) const;

  LabelId unk() const {
    return 0;
  }

  size_t role_size() const {
    return roles_.size();
  }

  size_t sense_size() const {
    return senses_.size();
  }

  std::vector<Label> get_roles() const {
    return roles_;
  }

  bool valid_role(const LabelId id) const {
    return (id >= 0 && id < static_cast<LabelId>(roles_.size()));
  }

  bool valid_sense(const LabelId id) const {
    return (id >= 0 && id < static_cast<LabelId>(senses_.size()));
  }

 private:
  static LabelId convert(const Label& label, bool frozen,
                         std::vector<Label>* labels,
                         std::map<Label, LabelId>* ids);

  Label b0_;
  std::vector<Label> roles_;
  std::map<Label, LabelId> role_d_;
  std::vector<Label> senses_;
  std::map<Label, LabelId> sense_d_;
};

}  // namespace oxsrl

#endif  // CORPUSDICT_H_
