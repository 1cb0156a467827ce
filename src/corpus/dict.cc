#include "corpus/dict.h"

namespace oxsrl {

Dict::Dict() : b0_("<unk>") {
  roles_.reserve(64);
  convertRole(b0_, false);
  convertSense(b0_, false);
}

LabelId Dict::convert(const Label& label, bool frozen,
                      std::vector<Label>* labels,
                      std::map<Label, LabelId>* ids) {
  auto i = ids->find(label);
  if (i == ids->end()) {
    if (frozen) return 0;
    labels->push_back(label);
    (*ids)[label] = labels->size() - 1;
    return labels->size() - 1;
  } else {
    return i->second;
  }
}

LabelId Dict::convertRole(const Label& role, bool frozen) {
  return convert(role, frozen, &roles_, &role_d_);
}

LabelId Dict::convertSense(const Label& sense, bool frozen) {
  return convert(sense, frozen, &senses_, &sense_d_);
}

Label Dict::lookupRole(LabelId id) const {
  if (valid_role(id)) {
    return roles_[id];
  } else {
    return b0_;
  }
}

Label Dict::lookupSense(LabelId id) const {
  if (valid_sense(id)) {
    return senses_[id];
  } else {
    return b0_;
  }
}

}  // namespace oxsrl
