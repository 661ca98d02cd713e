#include "Module.h"

namespace dpos {

Module::Module(const std::string &name) : logger_(logging::getLogger(name)) {}

void Module::redirectLogger(const std::string &targetLoggerName) {
  logger_ = logging::getLogger(targetLoggerName);
}

} // namespace dpos
