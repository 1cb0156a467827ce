#include "srl/srl_corpus.h"

#include <iterator>

#include "srl/reader_factory.h"

namespace oxsrl {

SrlCorpus::SrlCorpus(const boost::shared_ptr<ReaderConfig>& config)
    : sentences_(), config_(config), dict_(boost::make_shared<Dict>()) {}

SrlCorpus::SrlCorpus(const boost::shared_ptr<ReaderConfig>& config,
                     const boost::shared_ptr<Dict>& dict)
    : sentences_(), config_(config), dict_(dict) {}

void SrlCorpus::readFile(const std::string& filename) {
  boost::shared_ptr<SrlReader> reader = createReader(config_);
  std::vector<SrlSentence> sentences = reader->read(filename);

  for (const auto& sent : sentences) {
    addLabels(sent);
  }
  sentences_.insert(sentences_.end(),
                    std::make_move_iterator(sentences.begin()),
                    std::make_move_iterator(sentences.end()));
  diagnostics_.insert(diagnostics_.end(), reader->diagnostics().begin(),
                      reader->diagnostics().end());
}

void SrlCorpus::add_sentence(const SrlSentence& sent) {
  addLabels(sent);
  sentences_.push_back(sent);
}

void SrlCorpus::addLabels(const SrlSentence& sent) {
  for (const auto* predicate : sent.predicates()) {
    if (predicate->sense()) dict_->convertSense(*predicate->sense(), false);
    for (const auto& argument : predicate->arguments()) {
      dict_->convertRole(argument.role(), false);
    }
  }
}

size_t SrlCorpus::size() const {
  return sentences_.size();
}

size_t SrlCorpus::numTokens() const {
  size_t total = 0;
  for (const auto& sent : sentences_)
    total += sent.size();

  return total;
}

size_t SrlCorpus::numPredicates() const {
  size_t total = 0;
  for (const auto& sent : sentences_)
    total += sent.num_predicates();

  return total;
}

size_t SrlCorpus::numArguments() const {
  size_t total = 0;
  for (const auto& sent : sentences_)
    total += sent.num_arguments();

  return total;
}

std::vector<int> SrlCorpus::roleCounts() const {
  std::vector<int> counts(dict_->role_size(), 0);
  for (const auto& sent : sentences_) {
    for (const auto* predicate : sent.predicates()) {
      for (const auto& argument : predicate->arguments())
        counts[dict_->convertRole(argument.role(), true)] += 1;
    }
  }

  return counts;
}

std::vector<int> SrlCorpus::senseCounts() const {
  std::vector<int> counts(dict_->sense_size(), 0);
  for (const auto& sent : sentences_) {
    for (const auto* predicate : sent.predicates()) {
      if (predicate->sense())
        counts[dict_->convertSense(*predicate->sense(), true)] += 1;
    }
  }

  return counts;
}

}  // namespace oxsrl
