#include "srl/reader_factory.h"

#include <boost/make_shared.hpp>

#include "corpus/errors.h"
#include "srl/conll2009_reader.h"
#include "srl/conll2012_reader.h"
#include "srl/united_reader.h"

namespace oxsrl {

boost::shared_ptr<SrlReader> createReader(
    const boost::shared_ptr<ReaderConfig>& config) {
  switch (config->format) {
    case CorpusFormat::conll2009:
      return boost::make_shared<Conll2009Reader>(config);
    case CorpusFormat::conll2012:
      return boost::make_shared<Conll2012Reader>(config);
    case CorpusFormat::united:
      return boost::make_shared<UnitedSrlReader>(config);
  }
  throw InvalidRequestError("Unsupported corpus format");
}

}  // namespace oxsrl
