#ifndef HC_CHAIN_MODULE_H
#define HC_CHAIN_MODULE_H

#include "Logger.h"
#include <string>

namespace hc {

/**
 * Base class for components that log.
 * Each module owns a named logger in the hierarchy (e.g. "hc.chain").
 */
class Module {
public:
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Re-parent this module's logger under another logger
   * @param targetLoggerName Name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  const std::string &getLoggerName() const { return loggerName_; }

  logging::Logger &log() const { return logger_; }

private:
  std::string loggerName_;
  mutable logging::Logger logger_;
};

} // namespace hc

#endif // HC_CHAIN_MODULE_H
