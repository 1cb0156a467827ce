#include "srl/united_reader.h"

#include <boost/algorithm/string.hpp>

namespace oxsrl {

namespace {

bool isPredicateSelf(const Label& role) {
  return role == "V" || role == "B-V";
}

}  // namespace

const size_t UnitedSrlReader::kMinColumns;
const size_t UnitedSrlReader::kFirstRoleColumn;

UnitedSrlReader::UnitedSrlReader(const boost::shared_ptr<ReaderConfig>& config)
    : SrlReader(config) {}

std::map<std::string, std::string> UnitedSrlReader::parseMetadata(
    const std::vector<std::string>& comments) {
  std::map<std::string, std::string> metadata;
  for (const auto& comment : comments) {
    std::string text = boost::algorithm::trim_left_copy_if(
        comment, boost::algorithm::is_any_of("#"));
    size_t equals = text.find('=');
    if (equals == std::string::npos) continue;
    std::string key = boost::algorithm::trim_copy(text.substr(0, equals));
    std::string value = boost::algorithm::trim_copy(text.substr(equals + 1));
    if (!key.empty()) metadata[key] = value;
  }
  return metadata;
}

Spans UnitedSrlReader::columnSpans(const Tags& roles) {
  // in dependency data the predicate itself is still marked B-V
  bool is_span = false;
  for (const auto& role : roles) {
    if (role != "B-V" && boost::algorithm::starts_with(role, "B-")) {
      is_span = true;
      break;
    }
  }

  Spans spans;
  if (is_span) {
    spans = bioToSpans(roles);
  } else {
    // dependency roles are spans of length 1
    for (size_t i = 0; i < roles.size(); ++i) {
      if (roles[i] != "_") spans.push_back(Span(roles[i], i, i + 1));
    }
  }

  Spans arguments;
  for (const auto& span : spans) {
    if (!isPredicateSelf(span.label)) arguments.push_back(span);
  }
  return arguments;
}

boost::optional<std::string> UnitedSrlReader::sentenceId(
    const SentenceBlock& block) const {
  std::map<std::string, std::string> metadata = parseMetadata(block.comments);
  auto document = metadata.find("document_id");
  auto sentence = metadata.find("sentence_id");
  if (sentence == metadata.end()) sentence = metadata.find("sent_id");

  if (document != metadata.end() && sentence != metadata.end()) {
    return document->second + "_" + sentence->second;
  } else if (sentence != metadata.end()) {
    return sentence->second;
  }
  return boost::none;
}

SrlSentence UnitedSrlReader::parseSentence(const SentenceBlock& block,
                                           Diagnostics* diagnostics) const {
  std::vector<Columns> lines = splitBlock(block, kMinColumns, true);
  size_t role_columns = lines.front().size() - kFirstRoleColumn;

  size_t num_predicates = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    checkPosition(block, i, parseIndex(block, i, lines[i][0]) - 1);
    if (lines[i][3] != "_") ++num_predicates;
  }
  if (!config_->drop_unresolved_arguments && role_columns > num_predicates) {
    checkRoleColumns(block, role_columns, num_predicates);
  }

  SrlSentence sentence(sentenceId(block));
  Indices predicate_indices;
  for (size_t i = 0; i < lines.size(); ++i) {
    const Columns& columns = lines[i];
    Word word(normalizer_.normalizeUnited(columns[1]), static_cast<WordIndex>(i));
    word.lemma = columns[2];
    if (columns[3] != "_") {
      sentence.push_back(Predicate::fromWord(word, columns[3]));
      predicate_indices.push_back(i);
    } else {
      sentence.push_back(word);
    }
  }

  for (size_t k = 0; k < role_columns; ++k) {
    Tags roles;
    for (const auto& columns : lines) {
      roles.push_back(columns[kFirstRoleColumn + k]);
    }

    for (const auto& span : columnSpans(roles)) {
      std::string reason;
      if (k >= predicate_indices.size()) {
        reason = "role column " + std::to_string(k) + " has no predicate, sentence has "
            + std::to_string(predicate_indices.size());
      } else {
        try {
          sentence.makeArgument(predicate_indices[k], span.label, span.start, span.end);
          continue;
        } catch (const OutOfRangeError& e) {
          reason = e.what();
        }
      }

      if (!config_->drop_unresolved_arguments) {
        throw formatError(block, span.start, "Unresolved argument: " + reason);
      }
      if (diagnostics == nullptr) continue;
      DroppedArgument dropped;
      dropped.filename = block.filename;
      dropped.line_number = block.line_numbers[span.start];
      dropped.sentence_id = sentence.id() ? *sentence.id() : "";
      dropped.predicate_column = k;
      dropped.role = span.label;
      dropped.start = span.start;
      dropped.end = span.end;
      dropped.reason = reason;
      diagnostics->push_back(dropped);
    }
  }

  return sentence;
}

}  // namespace oxsrl
