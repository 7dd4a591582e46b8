#ifndef LOGGER_ENGINE_HPP
#define LOGGER_ENGINE_HPP

#include "LogExport.hpp"
#include "LogTypes.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace LogLib {

/**
 * @brief Core logging engine responsible for file management and rotation.
 * @details Project-agnostic. Files are written to
 *          <base>/<YYYYMMDD>/<category>.log, the empty category going to
 *          "system.log". Rotated files are renamed with a timestamp suffix
 *          and pruned down to max_log_files per category.
 */
class LOGLIB_API LoggerEngine {
public:
  static LoggerEngine &getInstance();

  // Configuration
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  using LogLevelProvider = std::function<LogLevel()>;
  void setLogLevelProvider(LogLevelProvider provider);

  void setLogBasePath(const std::string &path);

  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);

  void setMaxLogSizeMB(size_t size_mb);
  void setMaxLogFiles(int count);

  // Logging
  void log(const std::string &category, LogLevel level,
           const std::string &message);

  // Maintenance & Stats
  void flushAll();
  LogStatistics getStatistics() const;
  void resetStatistics();

  // Built-in Config Loader (Simple Key=Value parser)
  bool loadFromConfigFile(const std::string &path);
  static LogLevel stringToLogLevel(const std::string &level);

private:
  LoggerEngine();
  ~LoggerEngine();

  LoggerEngine(const LoggerEngine &) = delete;
  LoggerEngine &operator=(const LoggerEngine &) = delete;

  std::string buildLogPath(const std::string &category);
  std::filesystem::path buildLogFilePath(const std::string &category);

  void writeToFile(const std::string &filePath, const std::string &message);
  void checkAndRotateLogFile(const std::string &filePath,
                             std::ofstream &stream);
  void pruneRotatedFiles(const std::filesystem::path &original);

  std::string trim(const std::string &s);
  void applyConfig(const std::string &key, const std::string &value);

  std::string getCurrentDate();
  std::string getCurrentTimestamp();
  void updateStatistics(LogLevel level);

  mutable std::recursive_mutex mutex_;
  std::map<std::string, std::ofstream> logFiles_;

  LogLevel minLevel_;
  std::string log_base_path_;
  bool console_output_enabled_;
  bool file_output_enabled_;

  size_t max_log_size_mb_;
  int max_log_files_;

  LogLevelProvider log_level_provider_;

  LogStatistics statistics_;
};

} // namespace LogLib

#endif // LOGGER_ENGINE_HPP
