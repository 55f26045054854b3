#ifndef VOTE_LEDGER_LOGGER_H
#define VOTE_LEDGER_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace vl {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);

/**
 * Parse a level name ("debug", "INFO", ...), case-insensitive
 * @return true if the name was recognized
 */
bool parseLevel(const std::string &name, Level &level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

class ConsoleHandler : public Handler {
public:
  void emit(Level level, const std::string &message) override;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  ~FileHandler() override;
  void emit(Level level, const std::string &message) override;

private:
  std::ofstream file_;
  std::string filename_;
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
 * Collects one message and emits it on destruction.
 */
class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;
  LogStream(LogStream &&other) noexcept;

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

// Tree node shared by every Logger handle with the same name
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  explicit LoggerNode(const std::string &name);

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

  void addHandler(std::shared_ptr<Handler> spHandler);
  void clearHandlers();

  void setPropagate(bool propagate) { propagate_ = propagate; }
  bool getPropagate() const { return propagate_; }

  void setParent(const std::shared_ptr<LoggerNode> &parent) { parent_ = parent; }
  std::shared_ptr<LoggerNode> getParent() const { return parent_.lock(); }
  void addChild(const std::shared_ptr<LoggerNode> &child);
  void removeChild(const LoggerNode *child);
  std::vector<std::shared_ptr<LoggerNode>> getChildren() const;

  const std::string &getName() const { return name_; }
  std::string getFullName() const;

  // Emits to own handlers, then walks up while propagation is enabled
  void log(Level level, const std::string &message);

private:
  void emitToHandlers(Level level, const std::string &formatted);
  std::string formatMessage(Level level, const std::string &message) const;

  std::string name_;
  std::weak_ptr<LoggerNode> parent_;
  Level level_{Level::DEBUG};
  bool propagate_{true};
  std::vector<std::weak_ptr<LoggerNode>> children_;
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

/**
 * Lightweight handle to a LoggerNode.
 *
 * Usage:
 *   auto logger = logging::getLogger("ledger.pow");
 *   logger.info << "mined block " << index;
 */
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
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG);

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  /**
   * Move this logger (and its children) under another logger in the tree.
   * @throws std::invalid_argument on self or circular redirection
   */
  void redirectTo(const std::string &targetLoggerName);
  void redirectTo(const Logger &target);

  Logger getParent() const;
  std::vector<Logger> getChildren() const;
  bool isNull() const { return !spNode_; }

  const std::string &getName() const;
  std::string getFullName() const;

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  friend class LogStream;

  void log(Level level, const std::string &message);

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

// Registry access; names are dot separated ("ledger.pow")
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace vl

#endif // VOTE_LEDGER_LOGGER_H
