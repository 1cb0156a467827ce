#include "srl/srl_reader.h"

#include <algorithm>
#include <exception>
#include <fstream>
#include <iterator>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

namespace fs = boost::filesystem;

namespace oxsrl {

SrlReader::SrlReader(const boost::shared_ptr<ReaderConfig>& config)
    : config_(config), normalizer_(), diagnostics_() {}

SrlSentences SrlReader::read(const std::string& path) {
  if (!fs::is_directory(path)) {
    return readFile(path);
  }

  std::vector<std::string> files = listFiles(path);
  std::cerr << "Reading " << files.size() << " files from " << path << std::endl;

  int num_files = files.size();
  int threads = std::max(1, config_->threads);
  std::vector<SrlSentences> file_sentences(num_files);
  std::vector<Diagnostics> file_diagnostics(num_files);
  std::vector<std::exception_ptr> file_errors(num_files);

  #pragma omp parallel for num_threads(threads) schedule(dynamic)
  for (int i = 0; i < num_files; ++i) {
    // Exceptions may not leave the parallel region; the first one in file
    // order is rethrown below.
    try {
      file_sentences[i] = parseFile(files[i], &file_diagnostics[i]);
    } catch (...) {
      file_errors[i] = std::current_exception();
    }
  }

  SrlSentences sentences;
  for (int i = 0; i < num_files; ++i) {
    if (file_errors[i]) {
      std::rethrow_exception(file_errors[i]);
    }
    std::cerr << "Read " << file_sentences[i].size() << " sentences from "
              << files[i] << std::endl;
    addDiagnostics(file_diagnostics[i]);
    sentences.insert(sentences.end(),
                     std::make_move_iterator(file_sentences[i].begin()),
                     std::make_move_iterator(file_sentences[i].end()));
  }

  return sentences;
}

SrlSentences SrlReader::readFile(const std::string& filename) {
  std::cerr << "Reading from " << filename << std::endl;
  Diagnostics dropped;
  SrlSentences sentences = parseFile(filename, &dropped);
  addDiagnostics(dropped);
  return sentences;
}

SrlSentences SrlReader::readStream(std::istream& in, const std::string& name) {
  Diagnostics dropped;
  SrlSentences sentences = parseStream(in, name, &dropped);
  addDiagnostics(dropped);
  return sentences;
}

std::vector<std::string> SrlReader::listFiles(const std::string& path) const {
  std::vector<std::string> files;
  try {
    for (fs::recursive_directory_iterator it(path), end; it != end; ++it) {
      if (fs::is_regular_file(it->status())
          && boost::algorithm::ends_with(it->path().filename().string(),
                                         config_->file_suffix)) {
        files.push_back(it->path().string());
      }
    }
  } catch (const fs::filesystem_error& e) {
    throw CorpusFormatError(path, 0, std::string("Cannot list directory: ")
                            + e.what());
  }
  std::sort(files.begin(), files.end());
  return files;
}

SrlSentences SrlReader::parseStream(std::istream& in,
                                    const std::string& filename,
                                    Diagnostics* diagnostics) const {
  SrlSentences sentences;
  SentenceBlockReader blocks(in, filename, config_->comment_marker);
  SentenceBlock block;
  while (blocks.next(&block)) {
    sentences.push_back(parseSentence(block, diagnostics));
  }
  if (in.bad()) {
    throw CorpusFormatError(filename, 0, "Error while reading file");
  }
  return sentences;
}

SrlSentences SrlReader::parseFile(const std::string& filename,
                                  Diagnostics* diagnostics) const {
  std::ifstream in(filename);
  if (!in) {
    throw CorpusFormatError(filename, 0, "Cannot open file");
  }
  return parseStream(in, filename, diagnostics);
}

std::vector<Columns> SrlReader::splitBlock(const SentenceBlock& block,
                                           size_t min_columns,
                                           bool tabs_only) const {
  std::vector<Columns> lines;
  lines.reserve(block.size());
  for (size_t i = 0; i < block.size(); ++i) {
    Columns columns = tabs_only ? splitTabs(block.lines[i])
                                : splitWhitespace(block.lines[i]);
    if (columns.size() < min_columns) {
      throw formatError(block, i, "Expected at least "
                        + std::to_string(min_columns) + " columns, found "
                        + std::to_string(columns.size()));
    }
    if (!lines.empty() && columns.size() != lines.front().size()) {
      throw formatError(block, i, "Expected "
                        + std::to_string(lines.front().size())
                        + " columns as on the first line of the sentence, found "
                        + std::to_string(columns.size()));
    }
    lines.push_back(columns);
  }
  return lines;
}

WordIndex SrlReader::parseIndex(const SentenceBlock& block, size_t line,
                                const std::string& value) const {
  try {
    return boost::lexical_cast<WordIndex>(value);
  } catch (const boost::bad_lexical_cast&) {
    throw formatError(block, line, "Token index is not an integer: " + value);
  }
}

void SrlReader::checkPosition(const SentenceBlock& block, size_t line,
                              WordIndex index) const {
  if (index != static_cast<WordIndex>(line)) {
    throw formatError(block, line, "Token index " + std::to_string(index)
                      + " does not match its position "
                      + std::to_string(line) + " in the sentence");
  }
}

void SrlReader::checkRoleColumns(const SentenceBlock& block,
                                 size_t role_columns,
                                 size_t predicates) const {
  if (role_columns != predicates) {
    throw formatError(block, 0, "Sentence has " + std::to_string(predicates)
                      + " predicates but " + std::to_string(role_columns)
                      + " role columns");
  }
}

CorpusFormatError SrlReader::formatError(const SentenceBlock& block,
                                         size_t line,
                                         const std::string& message) const {
  int line_number = line < block.line_numbers.size()
      ? block.line_numbers[line] : block.first_line();
  return CorpusFormatError(block.filename, line_number, message);
}

void SrlReader::addDiagnostics(const Diagnostics& dropped) {
  for (const auto& argument : dropped) {
    std::cerr << argument << std::endl;
  }
  diagnostics_.insert(diagnostics_.end(), dropped.begin(), dropped.end());
}

}  // namespace oxsrl
