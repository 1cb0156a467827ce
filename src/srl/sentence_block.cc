#include "srl/sentence_block.h"

#include <boost/algorithm/string.hpp>

namespace oxsrl {

SentenceBlockReader::SentenceBlockReader(std::istream& in,
                                         const std::string& filename,
                                         const std::string& comment_marker)
    : in_(in),
      filename_(filename),
      comment_marker_(comment_marker),
      line_number_(0) {}

bool SentenceBlockReader::next(SentenceBlock* block) {
  block->clear();
  block->filename = filename_;

  std::string line;
  while (std::getline(in_, line)) {
    ++line_number_;
    boost::algorithm::trim_right_if(line, boost::algorithm::is_any_of("\r\n"));
    std::string trimmed = boost::algorithm::trim_copy(line);

    if (trimmed.empty()) {
      // end of sentence
      if (!block->empty()) return true;
      continue;
    }

    if (!comment_marker_.empty()
        && boost::algorithm::starts_with(trimmed, comment_marker_)) {
      block->comments.push_back(trimmed);
      continue;
    }

    block->lines.push_back(line);
    block->line_numbers.push_back(line_number_);
  }

  // last sentence without a trailing blank line
  return !block->empty();
}

}  // namespace oxsrl
