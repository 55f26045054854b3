#ifndef VOTE_LEDGER_MODULE_H
#define VOTE_LEDGER_MODULE_H

#include "Logger.h"

#include <string>

namespace vl {

/**
 * Base class for components that log.
 * Each module owns a named logger in the global logger tree.
 */
class Module {
public:
  /**
   * @param name Hierarchical logger name (e.g. "ledger.pow")
   */
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Move this module's logger under another logger
   * @param targetLoggerName Name of the new parent logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  logging::Logger &log() const { return logger_; }

private:
  mutable logging::Logger logger_;
};

} // namespace vl

#endif // VOTE_LEDGER_MODULE_H
