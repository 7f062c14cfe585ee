#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace pc {
namespace logging {

namespace {

std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

// Keyed by full dotted name; the root logger is "".
std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &getRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
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

std::shared_ptr<LoggerNode> createRoot() {
  auto root = std::make_shared<LoggerNode>("");
  root->setLevel(Level::INFO);
  root->addHandler(std::make_shared<ConsoleHandler>());
  return root;
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

std::optional<Level> levelFromString(const std::string &name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    return Level::DEBUG;
  }
  if (lower == "info") {
    return Level::INFO;
  }
  if (lower == "warning" || lower == "warn") {
    return Level::WARNING;
  }
  if (lower == "error") {
    return Level::ERROR;
  }
  if (lower == "critical") {
    return Level::CRITICAL;
  }
  return std::nullopt;
}

// ConsoleHandler
void ConsoleHandler::emit(Level level, const std::string & /*loggerName*/,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  if (level >= Level::WARNING) {
    std::cerr << message << std::endl;
  } else {
    std::cout << message << std::endl;
  }
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

void FileHandler::emit(Level level, const std::string & /*loggerName*/,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  file_ << message << std::endl;
}

// MemoryHandler
void MemoryHandler::emit(Level level, const std::string &loggerName,
                         const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back({level, loggerName, message});
}

std::vector<MemoryHandler::Record> MemoryHandler::getRecords() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

bool MemoryHandler::contains(const std::string &fragment) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(records_.begin(), records_.end(),
                     [&fragment](const Record &r) {
                       return r.message.find(fragment) != std::string::npos;
                     });
}

void MemoryHandler::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
}

// LogStream
LogStream::LogStream(std::shared_ptr<LoggerNode> node, Level level)
    : spNode_(std::move(node)), level_(level) {}

LogStream::~LogStream() {
  if (spNode_) {
    spNode_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : spNode_(std::move(other.spNode_)), level_(other.level_),
      stream_(std::move(other.stream_)) {
  other.spNode_.reset();
}

// LoggerNode
LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

void LoggerNode::setLevel(std::optional<Level> level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

std::optional<Level> LoggerNode::getLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

Level LoggerNode::getEffectiveLevel() const {
  auto level = getLevel();
  if (level) {
    return *level;
  }
  auto parent = getParent();
  return parent ? parent->getEffectiveLevel() : Level::DEBUG;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  if (!spHandler) {
    throw std::invalid_argument("Cannot add null log handler");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(std::move(spHandler));
}

void LoggerNode::removeHandler(const std::shared_ptr<Handler> &spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.erase(
      std::remove(spHandlers_.begin(), spHandlers_.end(), spHandler),
      spHandlers_.end());
}

std::vector<std::shared_ptr<Handler>> LoggerNode::getHandlers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spHandlers_;
}

void LoggerNode::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool LoggerNode::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

void LoggerNode::setParent(std::shared_ptr<LoggerNode> parent) {
  std::lock_guard<std::mutex> lock(mutex_);
  parent_ = parent;
}

std::shared_ptr<LoggerNode> LoggerNode::getParent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parent_.lock();
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
  if (level < getEffectiveLevel()) {
    return;
  }

  std::string originName = getFullName();
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!originName.empty()) {
    ss << "[" << originName << "] ";
  }
  ss << message;
  std::string formatted = ss.str();

  // Handler levels filter, ancestor levels do not
  std::shared_ptr<LoggerNode> node = shared_from_this();
  while (node) {
    node->emitToHandlers(level, originName, formatted);
    if (!node->getPropagate()) {
      break;
    }
    node = node->getParent();
  }
}

void LoggerNode::emitToHandlers(Level level, const std::string &originName,
                                const std::string &formatted) {
  std::vector<std::shared_ptr<Handler>> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers = spHandlers_;
  }
  for (auto &spHandler : handlers) {
    spHandler->emit(level, originName, formatted);
  }
}

// Logger
Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(node, Level::DEBUG), info(node, Level::INFO),
      warning(node, Level::WARNING), error(node, Level::ERROR),
      critical(node, Level::CRITICAL), spNode_(std::move(node)) {
  if (!spNode_) {
    throw std::invalid_argument("Logger requires a node");
  }
}

void Logger::addFileHandler(const std::string &filename, Level level) const {
  for (const auto &spExisting : spNode_->getHandlers()) {
    auto spFile = std::dynamic_pointer_cast<FileHandler>(spExisting);
    if (spFile && spFile->getFilename() == filename) {
      spFile->setLevel(level);
      return;
    }
  }
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  spNode_->addHandler(spHandler);
}

void Logger::redirectTo(const std::string &targetLoggerName) const {
  auto target = getLogger(targetLoggerName);
  auto targetNode = target.spNode_;

  if (targetNode == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }
  for (auto ancestor = targetNode; ancestor; ancestor = ancestor->getParent()) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
  }
  spNode_->setParent(targetNode);
}

Logger Logger::getParent() const {
  auto parent = spNode_->getParent();
  return Logger(parent ? parent : spNode_);
}

// Global logger management
Logger getLogger(const std::string &name) {
  std::string fullName = trimLeadingDot(name);
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  auto &registry = getRegistry();

  auto rootIt = registry.find("");
  if (rootIt == registry.end()) {
    rootIt = registry.emplace("", createRoot()).first;
  }
  if (fullName.empty()) {
    return Logger(rootIt->second);
  }

  auto it = registry.find(fullName);
  if (it != registry.end()) {
    return Logger(it->second);
  }

  // Create missing ancestors from the top down
  std::shared_ptr<LoggerNode> parent = rootIt->second;
  size_t start = 0;
  while (true) {
    size_t dot = fullName.find('.', start);
    std::string path = fullName.substr(0, dot);
    auto found = registry.find(path);
    if (found == registry.end()) {
      std::string nodeName = path.substr(start);
      auto node = std::make_shared<LoggerNode>(nodeName);
      node->setParent(parent);
      found = registry.emplace(path, node).first;
    }
    parent = found->second;
    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  return Logger(parent);
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace pc
