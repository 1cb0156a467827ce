#ifndef _SRL_READER_FACTORY_H_
#define _SRL_READER_FACTORY_H_

#include <boost/shared_ptr.hpp>

#include "srl/reader_config.h"
#include "srl/srl_reader.h"

namespace oxsrl {

// The dialect reader for config->format.
boost::shared_ptr<SrlReader> createReader(
    const boost::shared_ptr<ReaderConfig>& config);

}  // namespace oxsrl

#endif
