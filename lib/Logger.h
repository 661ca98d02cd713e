#ifndef DPOS_LEDGER_LOGGER_H
#define DPOS_LEDGER_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace dpos {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);

/** Parses "debug", "info", "warning", "error" or "critical"; INFO otherwise. */
Level levelFromString(const std::string &name);

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
  std::mutex mutex_;
};

class Logger;
class LogStream;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  template <typename T> LogStream operator<<(const T &value);

private:
  friend class Logger;

  Logger *logger_;
  Level level_;
};

// Collects one message and emits it on destruction
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
  bool moved_{ false };
};

// Node of the logger tree, shared by all Logger handles with the same name
class LoggerNode {
public:
  LoggerNode(const std::string &name, std::shared_ptr<LoggerNode> spParent);

  void setLevel(Level level);
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);

  void setPropagate(bool propagate) { propagate_ = propagate; }
  bool getPropagate() const { return propagate_; }

  const std::string &getFullName() const { return fullName_; }
  std::string getName() const;
  std::shared_ptr<LoggerNode> getParent() const { return spParent_; }

  void log(Level level, const std::string &message);

private:
  void emit(Level level, const std::string &formatted);

  std::string fullName_;
  std::shared_ptr<LoggerNode> spParent_;
  Level level_{ Level::DEBUG };
  bool hasLevel_{ false };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

// Lightweight handle to a LoggerNode
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> spNode);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);
  ~Logger() = default;

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

  std::string getName() const { return spNode_->getName(); }
  const std::string &getFullName() const { return spNode_->getFullName(); }
  Logger getParent() const;

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  friend class LogStream;

  void log(Level level, const std::string &message) {
    spNode_->log(level, message);
  }

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

/**
 * Get the logger with the given dotted name, creating it and its ancestors
 * on first use. "Chain.Ledger" is a child of "Chain", which is a child of
 * the root logger "".
 */
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace dpos

#endif // DPOS_LEDGER_LOGGER_H
