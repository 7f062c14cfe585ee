#include "Module.h"

namespace pc {

Module::Module(const std::string &name) : logger_(logging::getLogger(name)) {}

void Module::redirectLogger(const std::string &targetLoggerName) {
  logger_.redirectTo(targetLoggerName);
}

} // namespace pc
