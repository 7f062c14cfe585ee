#pragma once

#include "Logger.h"
#include <string>

namespace pc {

/**
 * Base class for components that log under their own name.
 */
class Module {
public:
  /**
   * @param name Hierarchical logger name (e.g. "blockchain.miner")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Redirect this module's logger under another logger
   * @param targetLoggerName Name of the new parent logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  const logging::Logger &log() const { return logger_; }

private:
  logging::Logger logger_;
};

} // namespace pc
