#ifndef OTLINK_LOG_MANAGER_H
#define OTLINK_LOG_MANAGER_H

/**
 * @file LogManager.h
 * @brief OtLink 통합 로그 관리자 - LogLib 기반 Delegation Wrapper
 * @details
 * 실제 파일 관리/로테이션은 독립 라이브러리인 LogLib::LoggerEngine 이 수행한다.
 * 이 클래스는 설정(ConfigManager) 연동과 프로젝트 전용 편의 메소드를 제공한다.
 */

#include "Common/Enums.h"

#include "LoggerEngine.hpp"

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

// 전역 네임스페이스 타입 별칭
using LogLevel = OtLink::Enums::LogLevel;

/**
 * @brief OtLink 전용 로그 관리자 (Wrapper)
 */
class LogManager {
public:
  static LogManager &getInstance() {
    static LogManager instance;
    instance.ensureInitialized();
    return instance;
  }

  bool isInitialized() const {
    return initialized_.load(std::memory_order_acquire);
  }

  // =============================================================================
  // 기본 로그 메소드들
  // =============================================================================
  void Info(const std::string &message);
  void Warn(const std::string &message);
  void Error(const std::string &message);
  void Fatal(const std::string &message);
  void Debug(const std::string &message);
  void Trace(const std::string &message);

  // 포맷 문자열 지원 템플릿 ("{}" 치환)
  template <typename... Args>
  void Info(const std::string &format, Args &&...args) {
    Info(formatString(format, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void Warn(const std::string &format, Args &&...args) {
    Warn(formatString(format, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void Error(const std::string &format, Args &&...args) {
    Error(formatString(format, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void Debug(const std::string &format, Args &&...args) {
    Debug(formatString(format, std::forward<Args>(args)...));
  }

  // 카테고리 로그
  void log(const std::string &category, LogLevel level,
           const std::string &message);
  void log(const std::string &category, const std::string &level,
           const std::string &message);

  void logDriver(const std::string &driverName, LogLevel level,
                 const std::string &message);
  void logHealth(LogLevel level, const std::string &message);

  // 설정 및 제어 (LoggerEngine 으로 위임)
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  void reloadSettings();
  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);
  void setLogBasePath(const std::string &path);

  LogLib::LogStatistics getStatistics() const;
  void resetStatistics();
  void flushAll();

private:
  LogManager();
  ~LogManager() = default;
  LogManager(const LogManager &) = delete;
  LogManager &operator=(const LogManager &) = delete;

  void ensureInitialized();
  void loadLogSettingsFromConfig();

  template <typename... Args>
  std::string formatString(const std::string &format, Args &&...args) {
    std::stringstream ss;
    size_t pos = 0;
    formatRecursive(ss, format, pos, std::forward<Args>(args)...);
    return ss.str();
  }

  template <typename T>
  void formatHelper(std::stringstream &ss, const std::string &format,
                    size_t &pos, const T &value) {
    size_t placeholder = format.find("{}", pos);
    if (placeholder != std::string::npos) {
      ss << format.substr(pos, placeholder - pos) << value;
      pos = placeholder + 2;
    } else {
      ss << format.substr(pos);
      pos = format.size();
    }
  }
  void formatRecursive(std::stringstream &ss, const std::string &format,
                       size_t &pos) {
    if (pos < format.size())
      ss << format.substr(pos);
  }
  template <typename T, typename... Args>
  void formatRecursive(std::stringstream &ss, const std::string &format,
                       size_t &pos, const T &value, Args &&...args) {
    formatHelper(ss, format, pos, value);
    formatRecursive(ss, format, pos, std::forward<Args>(args)...);
  }

  std::atomic<bool> initialized_;
  mutable std::recursive_mutex init_mutex_;
};

// 전역 편의 함수
inline LogManager &Logger() { return LogManager::getInstance(); }

#endif // OTLINK_LOG_MANAGER_H
