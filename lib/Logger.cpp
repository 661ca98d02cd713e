#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>

namespace dpos {
namespace logging {

namespace {

std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

std::map<std::string, std::shared_ptr<LoggerNode>> &getRegistry() {
  static std::map<std::string, std::shared_ptr<LoggerNode>> registry;
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
std::shared_ptr<LoggerNode> getOrCreateNode(const std::string &name) {
  auto &registry = getRegistry();
  auto it = registry.find(name);
  if (it != registry.end()) {
    return it->second;
  }

  std::shared_ptr<LoggerNode> spParent;
  if (!name.empty()) {
    auto lastDot = name.rfind('.');
    spParent = getOrCreateNode(lastDot == std::string::npos
                                   ? std::string()
                                   : name.substr(0, lastDot));
  }

  auto spNode = std::make_shared<LoggerNode>(name, spParent);
  if (name.empty()) {
    spNode->setLevel(Level::INFO);
    spNode->addHandler(std::make_shared<ConsoleHandler>());
  }
  registry[name] = spNode;
  return spNode;
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
  default:
    return "UNKNOWN";
  }
}

Level levelFromString(const std::string &name) {
  if (name == "debug" || name == "DEBUG") {
    return Level::DEBUG;
  }
  if (name == "warning" || name == "WARNING") {
    return Level::WARNING;
  }
  if (name == "error" || name == "ERROR") {
    return Level::ERROR;
  }
  if (name == "critical" || name == "CRITICAL") {
    return Level::CRITICAL;
  }
  return Level::INFO;
}

// ConsoleHandler implementation
void ConsoleHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  std::cout << message << std::endl;
}

// FileHandler implementation
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
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_ << message << std::endl;
  }
}

// LogProxy implementation
LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

// LogStream implementation
LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)) {
  other.moved_ = true;
}

// ========== LoggerNode Implementation ==========

LoggerNode::LoggerNode(const std::string &name,
                       std::shared_ptr<LoggerNode> spParent)
    : fullName_(name), spParent_(spParent) {}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
  hasLevel_ = true;
}

Level LoggerNode::getLevel() const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hasLevel_ || !spParent_) {
      return level_;
    }
  }
  return spParent_->getLevel();
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

std::string LoggerNode::getName() const {
  auto lastDot = fullName_.rfind('.');
  if (lastDot == std::string::npos) {
    return fullName_;
  }
  return fullName_.substr(lastDot + 1);
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < getLevel()) {
    return;
  }

  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!fullName_.empty()) {
    ss << "[" << fullName_ << "] ";
  }
  ss << message;
  std::string formatted = ss.str();

  LoggerNode *node = this;
  while (node) {
    node->emit(level, formatted);
    if (!node->propagate_) {
      break;
    }
    node = node->spParent_.get();
  }
}

void LoggerNode::emit(Level level, const std::string &formatted) {
  std::vector<std::shared_ptr<Handler>> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers = spHandlers_;
  }
  for (auto &spHandler : handlers) {
    spHandler->emit(level, formatted);
  }
}

// ========== Logger Implementation ==========

Logger::Logger(std::shared_ptr<LoggerNode> spNode)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(spNode) {}

Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  // Proxies keep pointing at this handle, only the node changes
  spNode_ = other.spNode_;
  return *this;
}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  spNode_->addHandler(spHandler);
}

Logger Logger::getParent() const {
  auto spParent = spNode_->getParent();
  if (!spParent) {
    return *this;
  }
  return Logger(spParent);
}

// ========== Global logger management ==========

Logger getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateNode(trimLeadingDot(name)));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace dpos
