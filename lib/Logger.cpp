#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace vl {
namespace logging {

namespace {

std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &getRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

std::string getCurrentTimestamp() {
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

// Caller holds the registry mutex
std::shared_ptr<LoggerNode> getOrCreateNode(const std::string &fullName) {
  auto &registry = getRegistry();
  auto it = registry.find(fullName);
  if (it != registry.end()) {
    return it->second;
  }

  if (fullName.empty()) {
    auto root = std::make_shared<LoggerNode>("");
    registry[""] = root;
    return root;
  }

  std::string parentName;
  std::string nodeName = fullName;
  auto lastDot = fullName.rfind('.');
  if (lastDot != std::string::npos) {
    parentName = fullName.substr(0, lastDot);
    nodeName = fullName.substr(lastDot + 1);
  }

  auto parent = getOrCreateNode(parentName);
  auto node = std::make_shared<LoggerNode>(nodeName);
  node->setLevel(parent->getLevel()); // new loggers start at the parent's level
  node->setParent(parent);
  parent->addChild(node);
  registry[fullName] = node;
  return node;
}

} // namespace

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
  }
  return "UNKNOWN";
}

bool parseLevel(const std::string &name, Level &level) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "DEBUG") {
    level = Level::DEBUG;
  } else if (upper == "INFO") {
    level = Level::INFO;
  } else if (upper == "WARNING" || upper == "WARN") {
    level = Level::WARNING;
  } else if (upper == "ERROR") {
    level = Level::ERROR;
  } else if (upper == "CRITICAL") {
    level = Level::CRITICAL;
  } else {
    return false;
  }
  return true;
}

// ConsoleHandler writes to stderr, stdout belongs to command output
void ConsoleHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
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

void FileHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  if (file_.is_open()) {
    file_ << message << std::endl;
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

// ========== LoggerNode ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {
  // Only the root prints, children reach it through propagation
  if (name_.empty()) {
    addHandler(std::make_shared<ConsoleHandler>());
  }
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(std::move(spHandler));
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::addChild(const std::shared_ptr<LoggerNode> &child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.push_back(child);
}

void LoggerNode::removeChild(const LoggerNode *child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.erase(std::remove_if(children_.begin(), children_.end(),
                                 [child](const std::weak_ptr<LoggerNode> &weak) {
                                   auto ptr = weak.lock();
                                   return !ptr || ptr.get() == child;
                                 }),
                  children_.end());
}

std::vector<std::shared_ptr<LoggerNode>> LoggerNode::getChildren() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<LoggerNode>> result;
  for (const auto &weak : children_) {
    if (auto child = weak.lock()) {
      result.push_back(child);
    }
  }
  return result;
}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;
  auto current = shared_from_this();
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

void LoggerNode::log(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  std::string formatted = formatMessage(level, message);
  auto node = shared_from_this();
  while (node) {
    node->emitToHandlers(level, formatted);
    if (!node->getPropagate()) {
      break;
    }
    node = node->getParent();
  }
}

void LoggerNode::emitToHandlers(Level level, const std::string &formatted) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &spHandler : spHandlers_) {
    spHandler->emit(level, formatted);
  }
}

std::string LoggerNode::formatMessage(Level level,
                                      const std::string &message) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  std::string fullName = getFullName();
  if (!fullName.empty()) {
    ss << "[" << fullName << "] ";
  }
  ss << message;
  return ss.str();
}

// ========== Logger ==========

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(std::move(node)) {}

Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  spNode_->addHandler(spHandler);
}

void Logger::log(Level level, const std::string &message) {
  if (spNode_) {
    spNode_->log(level, message);
  }
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  redirectTo(getLogger(targetLoggerName));
}

void Logger::redirectTo(const Logger &target) {
  if (!target.spNode_ || !spNode_) {
    throw std::invalid_argument("Cannot redirect null logger");
  }
  if (target.spNode_ == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }
  for (auto ancestor = target.spNode_; ancestor; ancestor = ancestor->getParent()) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
  }

  if (auto oldParent = spNode_->getParent()) {
    oldParent->removeChild(spNode_.get());
  }
  spNode_->setParent(target.spNode_);
  target.spNode_->addChild(spNode_);
}

Logger Logger::getParent() const {
  return Logger(spNode_ ? spNode_->getParent() : nullptr);
}

std::vector<Logger> Logger::getChildren() const {
  std::vector<Logger> result;
  if (!spNode_) {
    return result;
  }
  for (const auto &child : spNode_->getChildren()) {
    result.emplace_back(child);
  }
  return result;
}

const std::string &Logger::getName() const {
  static const std::string empty;
  return spNode_ ? spNode_->getName() : empty;
}

std::string Logger::getFullName() const {
  return spNode_ ? spNode_->getFullName() : std::string();
}

// ========== Registry ==========

Logger getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateNode(trimLeadingDot(name)));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace vl
