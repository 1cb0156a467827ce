#ifndef _SRL_READER_CONFIG_H_
#define _SRL_READER_CONFIG_H_

#include <string>

namespace oxsrl {

enum class CorpusFormat {conll2009, conll2012, united};

CorpusFormat corpusFormatFromString(const std::string& name);

std::string corpusFormatName(CorpusFormat format);

// Suffix of the corpus files collected from a directory for each format.
std::string defaultFileSuffix(CorpusFormat format);

struct ReaderConfig {
  ReaderConfig();

  explicit ReaderConfig(CorpusFormat format);

  CorpusFormat format;
  std::string  input_path;
  std::string  file_suffix;
  std::string  comment_marker;
  int          threads;
  // United corpus: drop arguments that cannot be resolved against the
  // sentence instead of failing the file.
  bool         drop_unresolved_arguments;

  bool operator==(const ReaderConfig& other) const;
};

}  // namespace oxsrl

#endif
