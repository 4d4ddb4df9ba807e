#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>

namespace tally {
namespace logging {

namespace {

std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

struct RegistryEntry {
  std::shared_ptr<LoggerNode> spNode;
  std::unique_ptr<Logger> upLogger;
};

std::map<std::string, RegistryEntry> &getRegistry() {
  static std::map<std::string, RegistryEntry> registry;
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

  std::tm tmBuf{};
  localtime_r(&time, &tmBuf);

  std::stringstream ss;
  ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

// Caller holds the registry mutex. Missing ancestors are created on the way.
RegistryEntry &getOrCreateLocked(const std::string &name) {
  auto &registry = getRegistry();
  auto it = registry.find(name);
  if (it != registry.end()) {
    return it->second;
  }

  auto spNode = std::make_shared<LoggerNode>(name);
  if (name.empty()) {
    // Only the root prints to the console; children reach it by propagation
    spNode->addHandler(std::make_shared<ConsoleHandler>());
  } else {
    auto lastDot = name.rfind('.');
    std::string parentName =
        lastDot == std::string::npos ? "" : name.substr(0, lastDot);
    spNode->setParent(getOrCreateLocked(parentName).spNode);
  }

  RegistryEntry entry;
  entry.spNode = spNode;
  entry.upLogger = std::make_unique<Logger>(spNode);
  auto inserted = registry.emplace(name, std::move(entry));
  return inserted.first->second;
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

ResultOrError<Level> parseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "DEBUG") {
    return Level::DEBUG;
  }
  if (upper == "INFO") {
    return Level::INFO;
  }
  if (upper == "WARNING" || upper == "WARN") {
    return Level::WARNING;
  }
  if (upper == "ERROR") {
    return Level::ERROR;
  }
  if (upper == "CRITICAL") {
    return Level::CRITICAL;
  }
  return RoeErrorBase(1, "Unknown log level: " + name);
}

// ConsoleHandler

void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  std::cout << message << std::endl;
}

// FileHandler

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
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

// LogProxy / LogStream

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

// LoggerNode

LoggerNode::LoggerNode(const std::string &fullName) : fullName_(fullName) {}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

Level LoggerNode::getLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool LoggerNode::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < getLevel()) {
    return;
  }

  std::string formatted = formatMessage(level, message);
  LoggerNode *node = this;
  while (node) {
    node->dispatch(level, formatted);
    if (!node->getPropagate()) {
      break;
    }
    node = node->spParent_.get();
  }
}

void LoggerNode::dispatch(Level level, const std::string &formatted) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &spHandler : spHandlers_) {
    spHandler->emit(level, fullName_, formatted);
  }
}

std::string LoggerNode::formatMessage(Level level,
                                      const std::string &message) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!fullName_.empty()) {
    ss << "[" << fullName_ << "] ";
  }
  ss << message;
  return ss.str();
}

// Logger

Logger::Logger(std::shared_ptr<LoggerNode> spNode)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(spNode) {}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  spNode_->addHandler(spHandler);
}

std::string Logger::getName() const {
  const std::string &fullName = spNode_->getFullName();
  auto lastDot = fullName.rfind('.');
  if (lastDot == std::string::npos) {
    return fullName;
  }
  return fullName.substr(lastDot + 1);
}

bool Logger::isChildOf(const Logger &other) const {
  return spNode_->getParent() == other.spNode_;
}

// Global logger management

Logger &getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return *getOrCreateLocked(trimLeadingDot(name)).upLogger;
}

Logger &getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace tally
