#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace hc {
namespace logging {

static std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

static std::recursive_mutex &getRegistryMutex() {
  static std::recursive_mutex mutex;
  return mutex;
}

static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &
getLoggerRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

static std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local{};
  localtime_r(&time, &local);
  std::stringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  // Diagnostics go to stderr so tool output on stdout stays parseable
  std::cerr << message << std::endl;
}

FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string &loggerName,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// ========== LoggerNode ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;
  auto current = std::const_pointer_cast<LoggerNode>(shared_from_this());
  while (current && !current->getName().empty()) {
    parts.push_back(current->getName());
    current = current->getParent();
  }

  std::string fullName;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (!fullName.empty()) {
      fullName += ".";
    }
    fullName += *it;
  }
  return fullName;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::log(Level level, const std::string &message,
                     const std::string &origin) {
  if (level < level_) {
    return;
  }
  logToHandlers(level, message, origin);

  if (propagate_) {
    auto parentNode = getParent();
    if (parentNode) {
      parentNode->log(level, message, origin);
    }
  }
}

void LoggerNode::logToHandlers(Level level, const std::string &message,
                               const std::string &origin) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (spHandlers_.empty()) {
    return;
  }

  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!origin.empty()) {
    ss << "[" << origin << "] ";
  }
  ss << message;
  std::string formatted = ss.str();

  for (auto &spHandler : spHandlers_) {
    spHandler->emit(level, origin, formatted);
  }
}

// ========== Logger ==========

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(node) {}

Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

Logger Logger::getParent() const {
  return Logger(spNode_->getParent());
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  auto target = logging::getLogger(targetLoggerName);
  auto targetNode = target.spNode_;

  if (targetNode == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }

  for (auto ancestor = targetNode; ancestor; ancestor = ancestor->getParent()) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
  }

  std::lock_guard<std::recursive_mutex> lock(getRegistryMutex());
  spNode_->setParent(targetNode);
}

// ========== Global logger management ==========

Logger getLogger(const std::string &name) {
  std::string trimmedName = trimLeadingDot(name);
  std::lock_guard<std::recursive_mutex> lock(getRegistryMutex());
  auto &registry = getLoggerRegistry();

  auto it = registry.find(trimmedName);
  if (it != registry.end()) {
    return Logger(it->second);
  }

  if (trimmedName.empty()) {
    // Root owns the only default console handler; children propagate to it
    auto root = std::make_shared<LoggerNode>("");
    root->addHandler(std::make_shared<ConsoleHandler>());
    registry[""] = root;
    return Logger(root);
  }

  std::string nodeName = trimmedName;
  std::string parentPath;
  auto lastDot = trimmedName.rfind('.');
  if (lastDot != std::string::npos) {
    parentPath = trimmedName.substr(0, lastDot);
    nodeName = trimmedName.substr(lastDot + 1);
  }

  auto node = std::make_shared<LoggerNode>(nodeName);
  registry[trimmedName] = node;

  // Recursion re-enters the registry mutex, hence recursive_mutex
  auto parent = getLogger(parentPath);
  node->setParent(parent.spNode_);

  return Logger(node);
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace hc
