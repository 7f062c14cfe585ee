#ifndef POWCHAIN_LOGGER_H
#define POWCHAIN_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace pc {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);

/**
 * Parse a level name, case-insensitive ("debug", "INFO", "warn", ...)
 * @return the level, or std::nullopt for an unknown name
 */
std::optional<Level> levelFromString(const std::string &name);

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

  const std::string &getFilename() const { return filename_; }

private:
  std::ofstream file_;
  std::string filename_;
};

/**
 * Keeps formatted records in memory, mostly for tests
 */
class MemoryHandler : public Handler {
public:
  struct Record {
    Level level;
    std::string loggerName;
    std::string message;
  };

  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;

  std::vector<Record> getRecords() const;
  bool contains(const std::string &fragment) const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<Record> records_;
};

class LoggerNode;

class LogStream {
public:
  LogStream(std::shared_ptr<LoggerNode> node, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;
  LogStream(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  std::shared_ptr<LoggerNode> spNode_;
  Level level_;
  std::ostringstream stream_;
};

class LogProxy {
public:
  LogProxy(std::shared_ptr<LoggerNode> node, Level level)
      : spNode_(std::move(node)), level_(level) {}

  template <typename T> LogStream operator<<(const T &value) const {
    LogStream stream(spNode_, level_);
    stream << value;
    return stream;
  }

private:
  std::shared_ptr<LoggerNode> spNode_;
  Level level_;
};

// Tree node behind a named logger. Unset level means inherit from parent.
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  explicit LoggerNode(const std::string &name);

  void setLevel(std::optional<Level> level);
  std::optional<Level> getLevel() const;
  Level getEffectiveLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);
  void removeHandler(const std::shared_ptr<Handler> &spHandler);
  std::vector<std::shared_ptr<Handler>> getHandlers() const;

  void setPropagate(bool propagate);
  bool getPropagate() const;

  void setParent(std::shared_ptr<LoggerNode> parent);
  std::shared_ptr<LoggerNode> getParent() const;

  const std::string &getName() const { return name_; }
  std::string getFullName() const;

  void log(Level level, const std::string &message);

private:
  void emitToHandlers(Level level, const std::string &originName,
                      const std::string &formatted);

  std::string name_;
  std::weak_ptr<LoggerNode> parent_;
  std::optional<Level> level_;
  bool propagate_{true};
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) const { spNode_->setLevel(level); }
  void resetLevel() const { spNode_->setLevel(std::nullopt); }
  Level getLevel() const { return spNode_->getEffectiveLevel(); }

  void addHandler(std::shared_ptr<Handler> spHandler) const {
    spNode_->addHandler(std::move(spHandler));
  }
  void removeHandler(const std::shared_ptr<Handler> &spHandler) const {
    spNode_->removeHandler(spHandler);
  }
  std::vector<std::shared_ptr<Handler>> getHandlers() const {
    return spNode_->getHandlers();
  }
  // A second call for the same file only updates that handler's level
  void addFileHandler(const std::string &filename,
                      Level level = Level::DEBUG) const;

  void setPropagate(bool propagate) const { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  // Re-parent this logger (and its subtree) under another logger
  void redirectTo(const std::string &targetLoggerName) const;
  Logger getParent() const;

  const std::string &getName() const { return spNode_->getName(); }
  std::string getFullName() const { return spNode_->getFullName(); }

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  std::shared_ptr<LoggerNode> spNode_;
};

// Global logger management. Names are dot separated ("blockchain.miner").
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace pc

#endif // POWCHAIN_LOGGER_H
