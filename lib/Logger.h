#ifndef TALLY_LOGGER_H
#define TALLY_LOGGER_H

#include "ResultOrError.hpp"

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace tally {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);

/**
 * Parse a level name such as "debug" or "WARNING" (case-insensitive)
 * @param name Level name
 * @return Parsed level, or error code 1 for unknown names
 */
ResultOrError<Level> parseLevel(const std::string &name);

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
};

class Logger;
class LogStream;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  template <typename T> LogStream operator<<(const T &value);

private:
  Logger *logger_;
  Level level_;
};

// Collects one message and hands it to the logger on destruction
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

// Tree node behind a Logger; holds level, handlers and the parent link
class LoggerNode {
public:
  explicit LoggerNode(const std::string &fullName);

  void setLevel(Level level);
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);

  void setPropagate(bool propagate);
  bool getPropagate() const;

  void setParent(std::shared_ptr<LoggerNode> spParent) { spParent_ = spParent; }
  std::shared_ptr<LoggerNode> getParent() const { return spParent_; }

  const std::string &getFullName() const { return fullName_; }

  void log(Level level, const std::string &message);

private:
  void dispatch(Level level, const std::string &formatted);
  std::string formatMessage(Level level, const std::string &message) const;

  std::string fullName_;
  std::shared_ptr<LoggerNode> spParent_;
  Level level_{ Level::DEBUG };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

/**
 * Stream-style logger, e.g. logger.info << "appended block " << n;
 * Instances live in a global registry and are handed out by reference.
 */
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> spNode);

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

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

  const std::string &getFullName() const { return spNode_->getFullName(); }
  std::string getName() const;

  bool isChildOf(const Logger &other) const;

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

// Dot separated names form the hierarchy: "tally.blockchain" has parent
// "tally", whose parent is the root logger ("").
Logger &getLogger(const std::string &name);
Logger &getRootLogger();

} // namespace logging
} // namespace tally

#endif // TALLY_LOGGER_H
