#ifndef _CORPUS_UTILS_H_
#define _CORPUS_UTILS_H_

#include <string>
#include <vector>
#include <iostream>
#include <chrono>

#include <boost/algorithm/string.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>

namespace oxsrl {

typedef int WordIndex;
typedef std::vector<WordIndex> Indices;
typedef std::string Label;
typedef std::vector<Label> Tags;
typedef std::vector<std::string> Columns;

typedef double Real;

typedef std::chrono::high_resolution_clock Clock;
typedef Clock::time_point Time;

// Head index stored for a token attached to the artificial root.
const WordIndex kRootHead = -1;

inline Time get_time() {
  return Clock::now();
}

inline Real get_duration(const Time& start_time, const Time& stop_time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(stop_time - start_time).count() / 1000.0;
}

inline bool is_ws(char x) {
  return (x == ' ' || x == '\t');
}

// Splits on runs of spaces and tabs, dropping empty fields.
inline Columns splitWhitespace(const std::string& line) {
  Columns columns;
  std::string trimmed = boost::algorithm::trim_copy_if(line, is_ws);
  if (trimmed.empty())
    return columns;
  boost::algorithm::split(columns, trimmed, is_ws, boost::algorithm::token_compress_on);
  return columns;
}

// Splits on single tabs, keeping empty fields.
inline Columns splitTabs(const std::string& line) {
  Columns columns;
  boost::algorithm::split(columns, line, boost::algorithm::is_any_of("\t"));
  return columns;
}

inline bool is_digits(const std::string& s) {
  return !s.empty() && boost::algorithm::all(s, boost::algorithm::is_digit());
}

}  // namespace oxsrl

#endif
