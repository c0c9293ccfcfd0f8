#ifndef HC_CHAIN_LOGGER_H
#define HC_CHAIN_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace hc {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &loggerName,
                    const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

class ConsoleHandler : public Handler {
public:
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  ~FileHandler() override;
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;

private:
  std::ofstream file_;
  std::string filename_;
  std::mutex mutex_;
};

class Logger;
class LogStream;
class LoggerNode;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  template <typename T> LogStream operator<<(const T &value);

private:
  Logger *logger_;
  Level level_;
};

/**
 * Accumulates one message; emitted when the last owner goes out of scope
 */
class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;

  LogStream(LogStream &&other) noexcept;
  LogStream &operator=(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
  bool moved_;
};

// Tree node holding level, handlers and the parent link of one logger name
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  explicit LoggerNode(const std::string &name);

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

  void addHandler(std::shared_ptr<Handler> spHandler);
  void addFileHandler(const std::string &filename, Level level);

  void setPropagate(bool propagate) { propagate_ = propagate; }
  bool getPropagate() const { return propagate_; }

  void setParent(std::weak_ptr<LoggerNode> parent) { parent_ = parent; }
  std::shared_ptr<LoggerNode> getParent() const { return parent_.lock(); }

  void log(Level level, const std::string &message,
           const std::string &origin);

  const std::string &getName() const { return name_; }
  std::string getFullName() const;

private:
  void logToHandlers(Level level, const std::string &message,
                     const std::string &origin);

  std::string name_;
  std::weak_ptr<LoggerNode> parent_;
  Level level_{ Level::DEBUG };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

// Lightweight handle to a LoggerNode, cheap to copy
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { spNode_->setLevel(level); }
  Level getLevel() const { return spNode_->getLevel(); }

  void addHandler(std::shared_ptr<Handler> spHandler) {
    spNode_->addHandler(spHandler);
  }
  void addFileHandler(const std::string &filename,
                      Level level = Level::DEBUG) {
    spNode_->addFileHandler(filename, level);
  }

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  /**
   * Re-parent this logger (and everything below it) under another logger
   * @throws std::invalid_argument on self or circular redirection
   */
  void redirectTo(const std::string &targetLoggerName);

  Logger getParent() const;

  const std::string &getName() const { return spNode_->getName(); }
  std::string getFullName() const { return spNode_->getFullName(); }

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  friend class LogStream;
  friend Logger getLogger(const std::string &name);

  void log(Level level, const std::string &message) {
    if (spNode_) {
      spNode_->log(level, message, spNode_->getFullName());
    }
  }

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

// Loggers are created on first use; dotted names form the hierarchy
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace hc

#endif // HC_CHAIN_LOGGER_H
