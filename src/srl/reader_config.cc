#include "srl/reader_config.h"

#include "corpus/errors.h"

namespace oxsrl {

CorpusFormat corpusFormatFromString(const std::string& name) {
  if (name == "conll2009" || name == "conll-2009") {
    return CorpusFormat::conll2009;
  } else if (name == "conll2012" || name == "conll-2012") {
    return CorpusFormat::conll2012;
  } else if (name == "united") {
    return CorpusFormat::united;
  }
  throw InvalidRequestError("Unknown corpus format: " + name
                            + ". Available formats are: conll2009, conll2012, united");
}

std::string corpusFormatName(CorpusFormat format) {
  switch (format) {
    case CorpusFormat::conll2009:
      return "conll2009";
    case CorpusFormat::conll2012:
      return "conll2012";
    case CorpusFormat::united:
      return "united";
  }
  return "";
}

std::string defaultFileSuffix(CorpusFormat format) {
  switch (format) {
    case CorpusFormat::conll2009:
      return ".txt";
    case CorpusFormat::conll2012:
      return ".gold_conll";
    case CorpusFormat::united:
      return ".conllu";
  }
  return "";
}

ReaderConfig::ReaderConfig()
    : format(CorpusFormat::conll2012), input_path(),
      file_suffix(defaultFileSuffix(CorpusFormat::conll2012)),
      comment_marker("#"), threads(1), drop_unresolved_arguments(true) {}

ReaderConfig::ReaderConfig(CorpusFormat format)
    : format(format), input_path(), file_suffix(defaultFileSuffix(format)),
      comment_marker("#"), threads(1), drop_unresolved_arguments(true) {}

bool ReaderConfig::operator==(const ReaderConfig& other) const {
  return format == other.format
      && input_path == other.input_path
      && file_suffix == other.file_suffix
      && comment_marker == other.comment_marker
      && threads == other.threads
      && drop_unresolved_arguments == other.drop_unresolved_arguments;
}

}  // namespace oxsrl
