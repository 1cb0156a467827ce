#ifndef _SRL_SENTENCE_BLOCK_H_
#define _SRL_SENTENCE_BLOCK_H_

#include <iostream>
#include <string>
#include <vector>

namespace oxsrl {

// The raw lines of one sentence, with the 1-based line number of each one in
// its file. Comment lines seen since the previous block are kept apart.
struct SentenceBlock {
  std::string              filename;
  std::vector<std::string> lines;
  std::vector<int>         line_numbers;
  std::vector<std::string> comments;

  void clear() {
    lines.clear();
    line_numbers.clear();
    comments.clear();
  }

  bool empty() const {
    return lines.empty();
  }

  size_t size() const {
    return lines.size();
  }

  int first_line() const {
    return line_numbers.empty() ? 0 : line_numbers.front();
  }
};

// Groups the lines of a stream into sentence blocks on blank lines, reading
// one line at a time.
class SentenceBlockReader {
 public:
  SentenceBlockReader(std::istream& in, const std::string& filename,
                      const std::string& comment_marker);

  // Fills block with the next non-empty sentence. Returns false at the end of
  // the stream.
  bool next(SentenceBlock* block);

 private:
  std::istream& in_;
  std::string filename_;
  std::string comment_marker_;
  int line_number_;
};

}  // namespace oxsrl

#endif
