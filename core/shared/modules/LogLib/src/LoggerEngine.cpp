#include "LoggerEngine.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace LogLib {

namespace fs = std::filesystem;

LoggerEngine::LoggerEngine()
    : minLevel_(LogLevel::INFO), log_base_path_("./logs/"),
      console_output_enabled_(true), file_output_enabled_(true),
      max_log_size_mb_(100), max_log_files_(30) {}

LoggerEngine::~LoggerEngine() { flushAll(); }

LoggerEngine &LoggerEngine::getInstance() {
  static LoggerEngine instance;
  return instance;
}

void LoggerEngine::setLogLevel(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  minLevel_ = level;
}

LogLevel LoggerEngine::getLogLevel() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (log_level_provider_) {
    return log_level_provider_();
  }
  return minLevel_;
}

void LoggerEngine::setLogLevelProvider(LogLevelProvider provider) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  log_level_provider_ = std::move(provider);
}

void LoggerEngine::setLogBasePath(const std::string &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  flushAll();
  log_base_path_ = path;
  if (!log_base_path_.empty() && log_base_path_.back() != '/' &&
      log_base_path_.back() != '\\') {
    log_base_path_ += fs::path::preferred_separator;
  }
}

void LoggerEngine::setConsoleOutput(bool enabled) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  console_output_enabled_ = enabled;
}

void LoggerEngine::setFileOutput(bool enabled) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  file_output_enabled_ = enabled;
}

void LoggerEngine::setMaxLogSizeMB(size_t size_mb) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  max_log_size_mb_ = size_mb;
}

void LoggerEngine::setMaxLogFiles(int count) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  max_log_files_ = count;
}

void LoggerEngine::log(const std::string &category, LogLevel level,
                       const std::string &message) {
  LogLevel current = getLogLevel();
  if (current == LogLevel::OFF ||
      static_cast<int>(level) < static_cast<int>(current))
    return;

  updateStatistics(level);

  std::ostringstream oss;
  oss << "[" << getCurrentTimestamp() << "]"
      << "[" << LogLevelToString(level) << "]";
  if (!category.empty()) {
    oss << "[" << category << "]";
  }
  oss << " " << message;

  std::lock_guard<std::recursive_mutex> lock(mutex_);
  std::string path = file_output_enabled_ ? buildLogPath(category) : "";
  writeToFile(path, oss.str());
}

void LoggerEngine::flushAll() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  for (auto &kv : logFiles_) {
    if (kv.second.is_open()) {
      kv.second.flush();
      kv.second.close();
    }
  }
  logFiles_.clear();
}

LogStatistics LoggerEngine::getStatistics() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return statistics_;
}

void LoggerEngine::resetStatistics() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  statistics_ = LogStatistics{};
}

bool LoggerEngine::loadFromConfigFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open())
    return false;

  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    size_t sep = line.find('=');
    if (sep != std::string::npos) {
      applyConfig(trim(line.substr(0, sep)), trim(line.substr(sep + 1)));
    }
  }
  return true;
}

// =============================================================================
// Internal Utilities
// =============================================================================

std::string LoggerEngine::trim(const std::string &s) {
  auto first = s.find_first_not_of(" \t\r\n\"");
  if (first == std::string::npos)
    return "";
  auto last = s.find_last_not_of(" \t\r\n\"");
  return s.substr(first, (last - first + 1));
}

void LoggerEngine::applyConfig(const std::string &key,
                               const std::string &value) {
  try {
    if (key == "LOG_LEVEL") {
      setLogLevel(stringToLogLevel(value));
    } else if (key == "LOG_FILE_PATH") {
      setLogBasePath(value);
    } else if (key == "LOG_TO_CONSOLE") {
      setConsoleOutput(value == "true" || value == "1");
    } else if (key == "LOG_TO_FILE") {
      setFileOutput(value == "true" || value == "1");
    } else if (key == "LOG_MAX_SIZE_MB") {
      setMaxLogSizeMB(static_cast<size_t>(std::stoul(value)));
    } else if (key == "LOG_MAX_FILES") {
      setMaxLogFiles(std::stoi(value));
    }
  } catch (const std::exception &e) {
    if (console_output_enabled_)
      std::cout << "[LoggerEngine] invalid value for " << key << ": " << value
                << " (" << e.what() << ")" << std::endl;
  }
}

LogLevel LoggerEngine::stringToLogLevel(const std::string &level) {
  std::string s = level;
  std::transform(s.begin(), s.end(), s.begin(), ::toupper);

  if (s == "TRACE")
    return LogLevel::TRACE;
  if (s == "DEBUG")
    return LogLevel::DEBUG;
  if (s == "INFO")
    return LogLevel::INFO;
  if (s == "WARN" || s == "WARNING")
    return LogLevel::WARN;
  if (s == "ERROR")
    return LogLevel::LOG_ERROR;
  if (s == "FATAL")
    return LogLevel::LOG_FATAL;
  if (s == "OFF")
    return LogLevel::OFF;
  return LogLevel::INFO;
}

std::string LoggerEngine::buildLogPath(const std::string &category) {
  fs::path log_file_path = buildLogFilePath(category);
  std::error_code ec;
  fs::create_directories(log_file_path.parent_path(), ec);
  if (ec) {
    return "";
  }
  return log_file_path.string();
}

fs::path LoggerEngine::buildLogFilePath(const std::string &category) {
  fs::path dir_path = fs::path(log_base_path_) / getCurrentDate();
  std::string name = category.empty() ? "system" : category;
  std::replace(name.begin(), name.end(), '/', '_');
  return dir_path / (name + ".log");
}

void LoggerEngine::writeToFile(const std::string &filePath,
                               const std::string &message) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (console_output_enabled_) {
    std::cout << message << std::endl;
  }

  if (file_output_enabled_ && !filePath.empty()) {
    std::ofstream &stream = logFiles_[filePath];
    if (!stream.is_open()) {
      stream.open(filePath, std::ios::app);
    }
    if (stream.is_open()) {
      stream << message << '\n';
      stream.flush();
      checkAndRotateLogFile(filePath, stream);
    }
  }
}

void LoggerEngine::checkAndRotateLogFile(const std::string &filePath,
                                         std::ofstream &stream) {
  if (!stream.is_open() || max_log_size_mb_ == 0)
    return;

  auto current_pos = stream.tellp();
  if (current_pos <= 0)
    return;

  size_t current_size_mb = static_cast<size_t>(current_pos) / (1024 * 1024);
  if (current_size_mb < max_log_size_mb_)
    return;

  stream.close();

  fs::path original_path(filePath);
  std::string backup_name = original_path.stem().string() + "_" +
                            getCurrentTimestamp() +
                            original_path.extension().string();
  std::replace(backup_name.begin(), backup_name.end(), ':', '-');
  std::replace(backup_name.begin(), backup_name.end(), ' ', '_');

  std::error_code ec;
  fs::rename(original_path, original_path.parent_path() / backup_name, ec);
  if (!ec) {
    statistics_.rotated_files++;
    pruneRotatedFiles(original_path);
  }

  stream.open(filePath, std::ios::app);
}

void LoggerEngine::pruneRotatedFiles(const fs::path &original) {
  if (max_log_files_ <= 0)
    return;

  const std::string prefix = original.stem().string() + "_";
  std::vector<fs::directory_entry> rotated;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(original.parent_path(), ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_regular_file(ec) && name.rfind(prefix, 0) == 0)
      rotated.push_back(entry);
  }

  if (rotated.size() <= static_cast<size_t>(max_log_files_))
    return;

  std::sort(rotated.begin(), rotated.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename() < b.path().filename();
            });
  size_t excess = rotated.size() - static_cast<size_t>(max_log_files_);
  for (size_t i = 0; i < excess; ++i) {
    fs::remove(rotated[i].path(), ec);
  }
}

std::string LoggerEngine::getCurrentDate() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y%m%d");
  return oss.str();
}

std::string LoggerEngine::getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << ms;
  return oss.str();
}

void LoggerEngine::updateStatistics(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  switch (level) {
  case LogLevel::TRACE:
    statistics_.trace_count++;
    break;
  case LogLevel::DEBUG:
    statistics_.debug_count++;
    break;
  case LogLevel::INFO:
    statistics_.info_count++;
    break;
  case LogLevel::WARN:
    statistics_.warn_count++;
    break;
  case LogLevel::LOG_ERROR:
    statistics_.error_count++;
    break;
  case LogLevel::LOG_FATAL:
    statistics_.fatal_count++;
    break;
  default:
    break;
  }

  statistics_.total_logs++;
  statistics_.last_log_time = std::chrono::system_clock::now();
}

} // namespace LogLib
