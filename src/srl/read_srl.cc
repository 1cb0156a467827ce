#include <fstream>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include "corpus/errors.h"
#include "corpus/utils.h"
#include "srl/reader_config.h"
#include "srl/srl_corpus.h"

using namespace boost::program_options;
using namespace oxsrl;

namespace {

void print_predicates(const SrlSentence& sent) {
  for (const auto* predicate : sent.predicates()) {
    std::cout << *predicate->index << "\t" << predicate->text << "\t"
              << (predicate->sense() ? *predicate->sense() : "_");
    for (const auto& argument : predicate->arguments()) {
      std::cout << " " << argument;
    }
    std::cout << std::endl;
  }
}

}  // namespace

/* Reads an SRL corpus in one of the supported formats and reports its size.
 */
int main(int argc, char** argv) {
  options_description cmdline_specific("Command line specific options");
  cmdline_specific.add_options()
    ("help,h", "print help message")
    ("config,c", value<std::string>(),
        "Config file specifying additional command line options");

  options_description generic("Allowed options");
  generic.add_options()
    ("input,i", value<std::string>(),
        "corpus file, or directory searched recursively for corpus files")
    ("format,f", value<std::string>()->default_value("conll2012"),
        "corpus format: conll2009, conll2012 or united")
    ("suffix,s", value<std::string>(),
        "suffix of the corpus files in a directory (default depends on the format)")
    ("threads,t", value<int>()->default_value(1),
        "number of files parsed in parallel")
    ("strict", value<bool>()->default_value(false),
        "fail on unresolvable arguments in united files instead of dropping them")
    ("print", value<bool>()->default_value(false),
        "print every sentence with its predicates and arguments")
    ("roles", value<bool>()->default_value(false),
        "print the number of arguments of each role");
  options_description config_options, cmdline_options;
  config_options.add(generic);
  cmdline_options.add(generic).add(cmdline_specific);

  variables_map vm;
  try {
    store(parse_command_line(argc, argv, cmdline_options), vm);
    if (vm.count("config") > 0) {
      std::ifstream config(vm["config"].as<std::string>().c_str());
      store(parse_config_file(config, config_options), vm);
    }
    notify(vm);
  } catch (const error& e) {
    std::cerr << e.what() << "\n" << cmdline_options << "\n";
    return 1;
  }

  if (vm.count("help") || !vm.count("input")) {
    std::cerr << cmdline_options << "\n";
    return 1;
  }

  boost::shared_ptr<ReaderConfig> config = boost::make_shared<ReaderConfig>();
  try {
    config->format = corpusFormatFromString(vm["format"].as<std::string>());
  } catch (const InvalidRequestError& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  config->input_path = vm["input"].as<std::string>();
  config->file_suffix = vm.count("suffix") ? vm["suffix"].as<std::string>()
                                           : defaultFileSuffix(config->format);
  config->threads = vm["threads"].as<int>();
  config->drop_unresolved_arguments = !vm["strict"].as<bool>();

  std::cerr << "################################" << std::endl;
  std::cerr << "# Config Summary" << std::endl;
  std::cerr << "# format = " << corpusFormatName(config->format) << std::endl;
  std::cerr << "# input = " << config->input_path << std::endl;
  std::cerr << "# suffix = " << config->file_suffix << std::endl;
  std::cerr << "# threads = " << config->threads << std::endl;
  std::cerr << "# drop unresolved arguments = " << config->drop_unresolved_arguments << std::endl;
  std::cerr << "################################" << std::endl;

  SrlCorpus corpus(config);
  auto start = get_time();
  try {
    corpus.readFile(config->input_path);
  } catch (const CorpusFormatError& e) {
    std::cerr << "Corpus format error: " << e.what() << std::endl;
    return 2;
  } catch (const SrlError& e) {
    std::cerr << e.what() << std::endl;
    return 2;
  }
  auto stop = get_time();

  std::cerr << "Corpus size: " << corpus.size() << " sentences\t ("
            << corpus.numTokens() << " tokens, " << corpus.numPredicates()
            << " predicates, " << corpus.numArguments() << " arguments)\n";
  if (!corpus.diagnostics().empty()) {
    std::cerr << "Dropped " << corpus.diagnostics().size() << " arguments\n";
  }
  std::cerr << "Reading done...time " << get_duration(start, stop) << "s\n";

  if (vm["print"].as<bool>()) {
    for (const auto& sent : corpus.sentences()) {
      if (sent.id()) std::cout << "# id = " << *sent.id() << std::endl;
      sent.print_sentence();
      print_predicates(sent);
      std::cout << std::endl;
    }
  }

  if (vm["roles"].as<bool>()) {
    std::vector<int> counts = corpus.roleCounts();
    for (size_t i = 1; i < counts.size(); ++i) {
      std::cout << corpus.dict()->lookupRole(i) << "\t" << counts[i] << std::endl;
    }
  }

  return 0;
}
