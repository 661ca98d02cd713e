#pragma once

#include "Logger.h"
#include <string>

namespace dpos {

/**
 * Base class for modules that need logging functionality.
 * Provides a common interface for logger management across components.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g.,
   * "Chain.Ledger")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Point this module at another logger, typically a child of its owner
   * @param targetLoggerName Full dotted name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  const std::string &getLoggerName() const { return logger_.getFullName(); }

  /**
   * Get the logger instance for this module.
   * @return Reference to the logger instance
   */
  logging::Logger &log() const { return logger_; }

private:
  mutable logging::Logger logger_;
};

} // namespace dpos
