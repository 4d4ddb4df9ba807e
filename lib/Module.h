#ifndef TALLY_MODULE_H
#define TALLY_MODULE_H

#include "Logger.h"

#include <string>

namespace tally {

/**
 * Base class for components that log under their own name.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical logger name (e.g. "tally.blockchain")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  const std::string &getLoggerName() const;

  /**
   * Get the logger instance for this module.
   * @return Reference to the registry-owned logger
   */
  logging::Logger &log() const;

private:
  std::string loggerName_;
};

} // namespace tally

#endif // TALLY_MODULE_H
