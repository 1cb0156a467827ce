#ifndef _CORPUS_ERRORS_H_
#define _CORPUS_ERRORS_H_

#include <stdexcept>
#include <string>

namespace oxsrl {

class SrlError : public std::runtime_error {
 public:
  explicit SrlError(const std::string& message)
      : std::runtime_error(message) {}
};

// A slot, predicate or span index outside the sentence.
class OutOfRangeError : public SrlError {
 public:
  explicit OutOfRangeError(const std::string& message) : SrlError(message) {}
};

// A predicate-only operation on a slot that holds a plain word.
class TypeMismatchError : public SrlError {
 public:
  explicit TypeMismatchError(const std::string& message) : SrlError(message) {}
};

class InvalidRequestError : public SrlError {
 public:
  explicit InvalidRequestError(const std::string& message) : SrlError(message) {}
};

// Malformed corpus input, located by file and 1-based line number.
class CorpusFormatError : public SrlError {
 public:
  CorpusFormatError(const std::string& filename, int line_number,
                    const std::string& message)
      : SrlError(filename + ":" + std::to_string(line_number) + ": " + message),
        filename_(filename),
        line_number_(line_number) {}

  const std::string& filename() const { return filename_; }

  int line_number() const { return line_number_; }

 private:
  std::string filename_;
  int line_number_;
};

}  // namespace oxsrl

#endif
